#include <iostream>
#include <sstream>
#include <algorithm>
#include <stdexcept>

#include "halo_catalog_builder.h"
#include "config_parser.h"

CatalogBuilder_t::CatalogBuilder_t(MEGAInt part_threshold, MEGAInt max_sample_size): PartThreshold(part_threshold), MaxSampleSize(max_sample_size)
{
  MPI_Type_contiguous(4, MPI_MEGA_INT, &MPI_MEGA_OrderKey);
  MPI_Type_commit(&MPI_MEGA_OrderKey);
  MPI_Type_contiguous(2, MPI_MEGA_INT, &MPI_MEGA_ParticleHalo);
  MPI_Type_commit(&MPI_MEGA_ParticleHalo);
}
CatalogBuilder_t::~CatalogBuilder_t()
{
  My_Type_free(&MPI_MEGA_OrderKey);
  My_Type_free(&MPI_MEGA_ParticleHalo);
}

void CatalogBuilder_t::FindProgenitors(MpiWorker_t &world, const vector <vector <Particle_t> > &candidates, const HaloSnapshot_t *prior, vector <char> &has_progenitor) const
/*a progenitor is a real halo of the prior catalog sharing a particle with the candidate.
 * the prior catalog may be spread over any of the workers, so every small candidate is checked everywhere*/
{
  has_progenitor.assign(candidates.size(), 0);
  vector <MEGAInt> LocalCandidates, LocalSizes, LocalIds;
  for(MEGAInt i=0;i<(MEGAInt)candidates.size();i++)
	if(NeedProgenitorCheck(candidates[i].size()))
	{
	  LocalCandidates.push_back(i);
	  LocalSizes.push_back(candidates[i].size());
	  for(auto &&p: candidates[i])
		LocalIds.push_back(p.Id);
	}
  MEGAInt nlocal=LocalCandidates.size(), nall=0;
  MPI_Allreduce(&nlocal, &nall, 1, MPI_MEGA_INT, MPI_SUM, world.Communicator);
  if(nall==0) return;

  vector <MEGAInt> AllSizes, AllIds;
  VectorAllGather(world, LocalSizes, AllSizes, MPI_MEGA_INT);
  VectorAllGather(world, LocalIds, AllIds, MPI_MEGA_INT);

  vector <int> flags(AllSizes.size(), 0);
  if(prior!=nullptr&&prior->ParticleHash.size())
  {
	MEGAInt offset=0;
	for(size_t i=0;i<AllSizes.size();i++)
	{
	  for(MEGAInt j=0;j<AllSizes[i];j++)
	  {
		MEGAInt ihalo=prior->GetHaloIndex(AllIds[offset+j]);
		if(ihalo!=SpecialConst::NullHaloId&&prior->Halos[ihalo].Real)
		{
		  flags[i]=1;
		  break;
		}
	  }
	  offset+=AllSizes[i];
	}
  }
  MPI_Allreduce(MPI_IN_PLACE, flags.data(), flags.size(), MPI_INT, MPI_LOR, world.Communicator);

  MEGAInt first=world.ExclusiveSum(nlocal);
  for(MEGAInt i=0;i<nlocal;i++)
	has_progenitor[LocalCandidates[i]]=flags[first+i];
}

void CatalogBuilder_t::AssignHaloIds(MpiWorker_t &world, HaloSnapshot_t &catalog) const
{
  vector <HaloOrderKey_t> LocalKeys(catalog.Halos.size()), AllKeys;
  for(MEGAInt i=0;i<(MEGAInt)catalog.Halos.size();i++)
  {
	auto &h=catalog.Halos[i];
	LocalKeys[i].Nparticles=h.Particles.size();
	LocalKeys[i].MinParticleId=h.MinParticleId();
	LocalKeys[i].Rank=world.rank();
	LocalKeys[i].LocalIndex=i;
  }
  VectorAllGather(world, LocalKeys, AllKeys, MPI_MEGA_OrderKey);
  sort(AllKeys.begin(), AllKeys.end(), CompHaloOrder);
  for(MEGAInt i=0;i<(MEGAInt)AllKeys.size();i++)
	if(AllKeys[i].Rank==world.rank())
	{
	  auto &h=catalog.Halos[AllKeys[i].LocalIndex];
	  h.HaloId=i;
	  h.GlobalId=catalog.SnapshotIndex*SpecialConst::HaloIdStride+i;
	}
  catalog.TotNumberOfHalos=AllKeys.size();
  if(catalog.TotNumberOfHalos>=SpecialConst::HaloIdStride)
	throw runtime_error("number of halos exceeds the id stride; enable MEGA_INT8");
  sort(catalog.Halos.begin(), catalog.Halos.end(), CompHaloId);
}

inline bool CompParticleHalo(const ParticleHalo_t &a, const ParticleHalo_t &b)
{
  return a.ParticleId<b.ParticleId;
}
bool FindDuplicateMember(vector <ParticleHalo_t> &members, MEGAInt &pid)
{
  sort(members.begin(), members.end(), CompParticleHalo);
  for(size_t i=1;i<members.size();i++)
	if(members[i].ParticleId==members[i-1].ParticleId)
	{
	  pid=members[i].ParticleId;
	  return true;
	}
  return false;
}

void CatalogBuilder_t::CheckExclusiveMembership(MpiWorker_t &world, const HaloSnapshot_t &catalog) const
{
  int nranks=world.size();
  vector <vector <ParticleHalo_t> > SendVecs(nranks), ReceiveVecs;
  for(auto &&h: catalog.Halos)
	for(auto &&p: h.Particles)
	{
	  ParticleHalo_t m;
	  m.ParticleId=p.Id;
	  m.HaloId=h.HaloId;
	  SendVecs[((p.Id%nranks)+nranks)%nranks].push_back(m);
	}
  VectorAllToAll(world, SendVecs, ReceiveVecs, MPI_MEGA_ParticleHalo);
  SendVecs.clear();
  vector <ParticleHalo_t> members;
  for(auto &&v: ReceiveVecs)
	members.insert(members.end(), v.begin(), v.end());
  ReceiveVecs.clear();

  MEGAInt pid=SpecialConst::NullParticleId, badpid=SpecialConst::NullParticleId;
  if(!FindDuplicateMember(members, pid))
	pid=SpecialConst::NullParticleId;
  MPI_Allreduce(&pid, &badpid, 1, MPI_MEGA_INT, MPI_MAX, world.Communicator);
  if(badpid!=SpecialConst::NullParticleId)
  {
	stringstream msg;
	msg<<"particle "<<badpid<<" belongs to more than one halo at snapshot "<<catalog.SnapshotIndex;
	throw logic_error(msg.str());
  }
}

MEGAInt CatalogBuilder_t::Build(MpiWorker_t &world, vector <vector <Particle_t> > &candidates, const HaloSnapshot_t *prior, HaloSnapshot_t &catalog) const
{
  for(auto &&c: candidates)
	sort(c.begin(), c.end(), CompParticleId);

  vector <char> has_progenitor;
  FindProgenitors(world, candidates, prior, has_progenitor);

  catalog.Halos.clear();
  MEGAInt ndropped=0;
  for(MEGAInt i=0;i<(MEGAInt)candidates.size();i++)
  {
	if(candidates[i].empty()) continue;
	if(!KeepHalo(candidates[i].size(), PartThreshold, has_progenitor[i]))
	{
	  ndropped++;
	  continue;
	}
	catalog.Halos.emplace_back();
	catalog.Halos.back().Particles.swap(candidates[i]);
  }
  candidates.clear();

  #pragma omp parallel for schedule(dynamic,1)
  for(MEGAInt i=0;i<(MEGAInt)catalog.Halos.size();i++)
	catalog.Halos[i].ComputeProperties(catalog.Cosmology, MaxSampleSize);

  AssignHaloIds(world, catalog);
  CheckExclusiveMembership(world, catalog);

  MEGAInt ndropped_all=0;
  MPI_Allreduce(&ndropped, &ndropped_all, 1, MPI_MEGA_INT, MPI_SUM, world.Communicator);
  return ndropped_all;
}
