#include <iostream>
#include <algorithm>

#include "halo_linker.h"
#include "halo_catalog_builder.h"

void MergeLinks(vector <DirectLink_t> &links)
{
  sort(links.begin(), links.end(), CompLinkPair);
  size_t n=0;
  for(size_t i=0;i<links.size();i++)
  {
	if(n>0&&links[n-1].ProgenitorId==links[i].ProgenitorId&&links[n-1].DescendantId==links[i].DescendantId)
	  links[n-1].SharedParticles+=links[i].SharedParticles;
	else
	  links[n++]=links[i];
  }
  links.resize(n);
}

HaloLinker_t::HaloLinker_t()
{
  MPI_Type_contiguous(2, MPI_MEGA_INT, &MPI_MEGA_Membership);
  MPI_Type_commit(&MPI_MEGA_Membership);
  MPI_Type_contiguous(3, MPI_MEGA_INT, &MPI_MEGA_Link);
  MPI_Type_commit(&MPI_MEGA_Link);
}
HaloLinker_t::~HaloLinker_t()
{
  My_Type_free(&MPI_MEGA_Membership);
  My_Type_free(&MPI_MEGA_Link);
}

class MemberKeyList_t: public KeyList_t <MEGAInt, MEGAInt>
{
  const vector <ParticleHalo_t> &Members;
public:
  MemberKeyList_t(const vector <ParticleHalo_t> &members): Members(members)
  {
  }
  MEGAInt GetKey(const MEGAInt i) const
  {
	return Members[i].ParticleId;
  }
  MEGAInt GetIndex(const MEGAInt i) const
  {
	return Members[i].HaloId;
  }
  MEGAInt size() const
  {
	return Members.size();
  }
};

static void JoinMembers(const vector <ParticleHalo_t> &progenitors, const vector <ParticleHalo_t> &descendants, vector <DirectLink_t> &links)
/*hash join on particle id*/
{
  MemberKeyList_t keys(progenitors);
  MappedIndexTable_t<MEGAInt, MEGAInt> hash;
  hash.Fill(keys, SpecialConst::NullHaloId);
  links.clear();
  for(auto &&d: descendants)
  {
	MEGAInt prog=hash.GetIndex(d.ParticleId);
	if(prog!=SpecialConst::NullHaloId)
	  links.emplace_back(prog, d.HaloId, 1);
  }
  MergeLinks(links);
}

static void CollectMembers(const HaloSnapshot_t &catalog, vector <ParticleHalo_t> &members)
{
  members.clear();
  members.reserve(catalog.CountParticles());
  for(auto &&h: catalog.Halos)
	for(auto &&p: h.Particles)
	{
	  ParticleHalo_t m;
	  m.ParticleId=p.Id;
	  m.HaloId=h.HaloId;
	  members.push_back(m);
	}
}

void HaloLinker_t::LinkSerial(const HaloSnapshot_t &progenitors, const HaloSnapshot_t &descendants, vector <DirectLink_t> &links)
{
  vector <ParticleHalo_t> ProgMembers, DescMembers;
  CollectMembers(progenitors, ProgMembers);
  CollectMembers(descendants, DescMembers);
  JoinMembers(ProgMembers, DescMembers, links);
}

void HaloLinker_t::Link(MpiWorker_t &world, const HaloSnapshot_t &progenitors, const HaloSnapshot_t &descendants, vector <DirectLink_t> &links) const
/*every membership goes to the worker pid%nranks, so each particle meets both its halos on one worker*/
{
  int nranks=world.size();
  vector <ParticleHalo_t> ProgMembers, DescMembers;
  {
	vector <ParticleHalo_t> members;
	vector <vector <ParticleHalo_t> > SendVecs(nranks), ReceiveVecs;
	CollectMembers(progenitors, members);
	for(auto &&m: members)
	  SendVecs[((m.ParticleId%nranks)+nranks)%nranks].push_back(m);
	VectorAllToAll(world, SendVecs, ReceiveVecs, MPI_MEGA_Membership);
	for(auto &&v: ReceiveVecs)
	  ProgMembers.insert(ProgMembers.end(), v.begin(), v.end());

	SendVecs.assign(nranks, vector <ParticleHalo_t>());
	ReceiveVecs.clear();
	CollectMembers(descendants, members);
	for(auto &&m: members)
	  SendVecs[((m.ParticleId%nranks)+nranks)%nranks].push_back(m);
	VectorAllToAll(world, SendVecs, ReceiveVecs, MPI_MEGA_Membership);
	for(auto &&v: ReceiveVecs)
	  DescMembers.insert(DescMembers.end(), v.begin(), v.end());
  }

  vector <DirectLink_t> LocalLinks;
  JoinMembers(ProgMembers, DescMembers, LocalLinks);
  VectorAllGather(world, LocalLinks, links, MPI_MEGA_Link);
  MergeLinks(links);
}
