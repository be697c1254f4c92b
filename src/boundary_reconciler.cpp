#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "boundary_reconciler.h"
#include "disjoint_set.h"
#include "config_parser.h"

void LabelResolver_t::Resolve(const vector <LabelEdge_t> &edges)
{
  Labels.clear();
  Labels.reserve(edges.size()*2);
  for(auto &&e: edges)
  {
	Labels.push_back(e.LabelA);
	Labels.push_back(e.LabelB);
  }
  sort(Labels.begin(), Labels.end());
  Labels.erase(unique(Labels.begin(), Labels.end()), Labels.end());

  DisjointSet_t sets(Labels.size());
  for(auto &&e: edges)
  {
	MEGAInt a=lower_bound(Labels.begin(), Labels.end(), e.LabelA)-Labels.begin();
	MEGAInt b=lower_bound(Labels.begin(), Labels.end(), e.LabelB)-Labels.begin();
	sets.Union(a, b);
  }
  Roots.resize(Labels.size());
  for(MEGAInt i=0;i<(MEGAInt)Labels.size();i++)
	Roots[i]=Labels[sets.Find(i)];//the set root is its smallest index, hence the smallest label
}
bool LabelResolver_t::Contains(MEGAInt label) const
{
  return binary_search(Labels.begin(), Labels.end(), label);
}
MEGAInt LabelResolver_t::Root(MEGAInt label) const
{
  auto it=lower_bound(Labels.begin(), Labels.end(), label);
  if(it==Labels.end()||*it!=label) return label;
  return Roots[it-Labels.begin()];
}

void AssignGlobalLabels(const vector <MEGAInt> &grptags, MEGAInt label_offset, vector <MEGAInt> &labels)
{
  labels.resize(grptags.size());
  for(size_t i=0;i<grptags.size();i++)
	labels[i]=grptags[i]+label_offset;
}

int LabelOwner(MEGAInt label, const vector <MEGAInt> &label_offsets)
{
  auto it=upper_bound(label_offsets.begin(), label_offsets.end(), label);
  if(it==label_offsets.begin())
	throw logic_error("label below the first worker's offset");
  return (it-label_offsets.begin())-1;
}

void CollectGhostClaims(const vector <Particle_t> &particles, int thisrank, int nranks, const vector <MEGAInt> &labels, const vector <MEGAInt> &grptags, const vector <MEGAInt> &grplen, vector <vector <GhostClaim_t> > &claims)
/*a ghost left alone by FoF cannot connect anything; skip it*/
{
  claims.assign(nranks, vector <GhostClaim_t>());
  for(size_t i=0;i<particles.size();i++)
  {
	auto &p=particles[i];
	if(p.OwnerRank==thisrank) continue;
	if(grplen[grptags[i]]<2) continue;
	claims[p.OwnerRank].emplace_back(p.Id, labels[i]);
  }
}

void MatchGhostClaims(const vector <Particle_t> &particles, int thisrank, const vector <MEGAInt> &labels, const vector <GhostClaim_t> &claims, vector <LabelEdge_t> &edges)
{
  vector <MEGAInt> ids;
  vector <MEGAInt> owned;
  for(size_t i=0;i<particles.size();i++)
	if(particles[i].OwnerRank==thisrank)
	{
	  ids.push_back(particles[i].Id);
	  owned.push_back(i);
	}
  VectorKeyList_t<MEGAInt, MEGAInt> keys(ids);
  MappedIndexTable_t<MEGAInt, MEGAInt> hash;
  hash.Fill(keys);

  for(auto &&c: claims)
  {
	MEGAInt index=hash.GetIndex(c.ParticleId);
	if(index==hash.NullIndex)
	{
	  stringstream msg;
	  msg<<"ghost particle "<<c.ParticleId<<" claimed on worker "<<thisrank<<" which does not own it";
	  throw logic_error(msg.str());
	}
	MEGAInt label=labels[owned[index]];
	if(label!=c.Label)
	  edges.emplace_back(min(label, c.Label), max(label, c.Label));
  }
}

void RouteOwnedParticles(const vector <Particle_t> &particles, int thisrank, int nranks, const vector <MEGAInt> &labels, const vector <MEGAInt> &grptags, const vector <MEGAInt> &grplen, const LabelResolver_t &resolver, const vector <MEGAInt> &label_offsets, vector <vector <Particle_t> > &outgoing)
/*send every owned particle of a candidate halo to the worker owning the halo's final label, tagged with that label*/
{
  outgoing.assign(nranks, vector <Particle_t>());
  for(size_t i=0;i<particles.size();i++)
  {
	auto &p=particles[i];
	if(p.OwnerRank!=thisrank) continue;
	MEGAInt label=labels[i];
	if(grplen[grptags[i]]<2&&!resolver.Contains(label)) continue;//isolated particle
	MEGAInt root=resolver.Root(label);
	Particle_t q=p;
	q.HaloTag=root;
	outgoing[LabelOwner(root, label_offsets)].push_back(q);
  }
}

inline bool CompTagThenId(const Particle_t &a, const Particle_t &b)
{
  if(a.HaloTag!=b.HaloTag) return a.HaloTag<b.HaloTag;
  return a.Id<b.Id;
}
void GroupProvisionalHalos(vector <Particle_t> &received, MEGAInt min_size, ProvisionalHaloList_t &halos)
{
  halos.clear();
  sort(received.begin(), received.end(), CompTagThenId);
  size_t begin=0;
  while(begin<received.size())
  {
	size_t end=begin+1;
	while(end<received.size()&&received[end].HaloTag==received[begin].HaloTag)
	{
	  if(received[end].Id==received[end-1].Id)
	  {
		stringstream msg;
		msg<<"particle "<<received[end].Id<<" delivered twice to halo "<<received[begin].HaloTag;
		throw logic_error(msg.str());
	  }
	  end++;
	}
	if((MEGAInt)(end-begin)>=min_size)
	{
	  halos.emplace_back();
	  auto &h=halos.back();
	  h.Label=received[begin].HaloTag;
	  h.Particles.assign(received.begin()+begin, received.begin()+end);
	}
	begin=end;
  }
}

BoundaryReconciler_t::BoundaryReconciler_t()
{
  MPI_Type_contiguous(2, MPI_MEGA_INT, &MPI_MEGA_Claim);
  MPI_Type_commit(&MPI_MEGA_Claim);
  MPI_Type_contiguous(2, MPI_MEGA_INT, &MPI_MEGA_Edge);
  MPI_Type_commit(&MPI_MEGA_Edge);
}
BoundaryReconciler_t::~BoundaryReconciler_t()
{
  My_Type_free(&MPI_MEGA_Claim);
  My_Type_free(&MPI_MEGA_Edge);
}

void BoundaryReconciler_t::Reconcile(MpiWorker_t &world, const vector <Particle_t> &particles, const vector <MEGAInt> &grptags, const vector <MEGAInt> &grplen, MPI_Datatype MPI_MEGA_Particle, ProvisionalHaloList_t &halos)
{
  MEGAInt ngroups=grplen.size();
  MEGAInt offset=world.ExclusiveSum(ngroups);
  vector <MEGAInt> label_offsets(world.size());
  MPI_Allgather(&offset, 1, MPI_MEGA_INT, label_offsets.data(), 1, MPI_MEGA_INT, world.Communicator);

  vector <MEGAInt> labels;
  AssignGlobalLabels(grptags, offset, labels);

  vector <LabelEdge_t> edges;
  {
	vector <vector <GhostClaim_t> > claims, received;
	CollectGhostClaims(particles, world.rank(), world.size(), labels, grptags, grplen, claims);
	VectorAllToAll(world, claims, received, MPI_MEGA_Claim);
	vector <LabelEdge_t> local_edges;
	for(auto &&c: received)
	  MatchGhostClaims(particles, world.rank(), labels, c, local_edges);
	VectorAllGather(world, local_edges, edges, MPI_MEGA_Edge);
  }

  LabelResolver_t resolver;
  resolver.Resolve(edges);

  vector <vector <Particle_t> > outgoing, incoming;
  RouteOwnedParticles(particles, world.rank(), world.size(), labels, grptags, grplen, resolver, label_offsets, outgoing);
  VectorAllToAll(world, outgoing, incoming, MPI_MEGA_Particle);
  outgoing.clear();

  vector <Particle_t> received;
  for(auto &&v: incoming)
	received.insert(received.end(), v.begin(), v.end());
  incoming.clear();
  GroupProvisionalHalos(received, MEGAConfig.MinNumPartOfProvisionalHalo, halos);
}
