#include <algorithm>
#include <sstream>

#include "domain_decomposer.h"
#include "stage_graph.h"

DomainDecomposer_t::DomainDecomposer_t(int ndomains, MEGAReal boxsize, MEGAReal margin, bool periodic): Dims(ClosestFactors(ndomains, 3)), BoxSize(boxsize), Margin(margin), IsPeriodic(periodic), NumberOfDomains(ndomains)
{
  if(boxsize<=0)
	throw runtime_error("domain decomposition requires a positive box size");
  for(int i=0;i<3;i++)
  {
	Step[i]=boxsize/Dims[i];
	if(Dims[i]>1&&margin>Step[i])
	{
	  stringstream msg;
	  msg<<"ghost margin "<<margin<<" exceeds the domain cell size "<<Step[i]<<" along axis "<<i<<" ("<<ndomains<<" domains); use fewer workers";
	  throw ConfigError_t(msg.str());
	}
  }
}

void DomainDecomposer_t::GetGhostDomains(const MEGAxyz &pos, int owner, vector <int> &domains) const
{
  domains.clear();
  vector <int> grids[3];
  for(int i=0;i<3;i++)
  {
	int g=GetGrid(pos[i], Step[i], Dims[i]);
	grids[i].push_back(g);
	if(Dims[i]==1) continue;
	if(pos[i]-g*Step[i]<=Margin)
	{
	  if(g>0)
		grids[i].push_back(g-1);
	  else if(IsPeriodic)
		grids[i].push_back(Dims[i]-1);
	}
	if((g+1)*Step[i]-pos[i]<=Margin)
	{
	  if(g<Dims[i]-1)
		grids[i].push_back(g+1);
	  else if(IsPeriodic)
		grids[i].push_back(0);
	}
  }
  for(auto &&g0: grids[0])
	for(auto &&g1: grids[1])
	  for(auto &&g2: grids[2])
	  {
		int domain=(g0*Dims[1]+g1)*Dims[2]+g2;
		if(domain!=owner) domains.push_back(domain);
	  }
  sort(domains.begin(), domains.end());
  domains.erase(unique(domains.begin(), domains.end()), domains.end());
}

void DomainDecomposer_t::Assign(const vector <Particle_t> &particles, vector <vector <Particle_t> > &send) const
{
  send.assign(NumberOfDomains, vector <Particle_t>());
  vector <int> ghosts;
  for(auto &&p: particles)
  {
	int owner=GetOwner(p.ComovingPosition);
	Particle_t q=p;
	q.OwnerRank=owner;
	q.HaloTag=SpecialConst::NullLabel;
	send[owner].push_back(q);
	GetGhostDomains(p.ComovingPosition, owner, ghosts);
	for(auto &&d: ghosts)
	  send[d].push_back(q);
  }
}

inline bool CompOwnedFirst(const Particle_t &a, const Particle_t &b, int thisrank)
{
  bool aghost=(a.OwnerRank!=thisrank), bghost=(b.OwnerRank!=thisrank);
  if(aghost!=bghost) return bghost;
  return a.Id<b.Id;
}

void DomainDecomposer_t::Decompose(MpiWorker_t &world, vector <Particle_t> &particles, MPI_Datatype dtype) const
/*on return, particles holds the owned particles followed by the ghosts, each sorted by id*/
{
  if(world.size()!=NumberOfDomains)
	throw runtime_error("number of domains differs from the number of workers");
  vector <vector <Particle_t> > SendVecs, ReceiveVecs;
  Assign(particles, SendVecs);
  VectorFree(particles);
  VectorAllToAll(world, SendVecs, ReceiveVecs, dtype);
  SendVecs.clear();

  MEGAInt np=0;
  for(auto &&v: ReceiveVecs)
	np+=v.size();
  particles.reserve(np);
  for(auto &&v: ReceiveVecs)
  {
	particles.insert(particles.end(), v.begin(), v.end());
	VectorFree(v);
  }
  int thisrank=world.rank();
  sort(particles.begin(), particles.end(), [thisrank](const Particle_t &a, const Particle_t &b){return CompOwnedFirst(a, b, thisrank);});
}
