#include <cmath>
#include <algorithm>

#include "phase_space_refiner.h"
#include "kd_tree.h"
#include "disjoint_set.h"

int PhaseSpaceRefiner_t::MaxIterations(MEGAReal ini_alpha, MEGAReal min_alpha, MEGAReal decrement)
{
  if(decrement<=0||ini_alpha<=min_alpha) return 0;
  double x=((double)ini_alpha-min_alpha)/decrement;
  int n=ceil(x-1e-6*max(1., x));//absorb the rounding error of an exact multiple
  return max(n, 0);
}

void PhaseSpaceRefiner_t::FindSpatialPairs(const vector <Particle_t> &particles, vector <Pair_t> &pairs) const
{
  ParticlePos_t posdata(particles);
  KDTree_t tree;
  tree.Build(posdata);
  pairs.clear();
  IndexCollector_t collector;
  for(MEGAInt i=0;i<(MEGAInt)particles.size();i++)
  {
	collector.Indices.clear();
	tree.Search(particles[i].ComovingPosition, SubLinkLength, collector);
	for(auto &&j: collector.Indices)
	  if(j>i)
	  {
		Pair_t p;
		p.i=i;
		p.j=j;
		pairs.push_back(p);
	  }
  }
}

void PhaseSpaceRefiner_t::HubbleVelocities(const vector <Particle_t> &particles, const vector <MEGAInt> &partition, MEGAInt ncomponents, vector <MEGAxyz> &velocities, vector <MEGAReal> &dispersions) const
/*velocity of every particle including the Hubble flow about the centre of its component,
 * and the rms velocity deviation of every component*/
{
  MEGAInt np=particles.size();
  vector <MEGAInt> first(ncomponents, -1), count(ncomponents, 0);
  vector <array<double, 3> > dx(ncomponents, {{0.,0.,0.}}), dv(ncomponents, {{0.,0.,0.}});
  for(MEGAInt i=0;i<np;i++)
  {
	MEGAInt c=partition[i];
	if(first[c]<0) first[c]=i;
	count[c]++;
	auto &origin=particles[first[c]].ComovingPosition;
	for(int k=0;k<3;k++)
	{
	  MEGAReal d=particles[i].ComovingPosition[k]-origin[k];
	  if(MEGAConfig.PeriodicBoundaryOn) d=NEAREST(d);
	  dx[c][k]+=d;
	}
  }
  vector <MEGAxyz> centre(ncomponents);
  for(MEGAInt c=0;c<ncomponents;c++)
	for(int k=0;k<3;k++)
	  centre[c][k]=particles[first[c]].ComovingPosition[k]+dx[c][k]/count[c];

  velocities.resize(np);
  for(MEGAInt i=0;i<np;i++)
  {
	MEGAInt c=partition[i];
	for(int k=0;k<3;k++)
	{
	  MEGAReal d=particles[i].ComovingPosition[k]-centre[c][k];
	  if(MEGAConfig.PeriodicBoundaryOn) d=NEAREST(d);
	  velocities[i][k]=particles[i].PhysicalVelocity[k]+HubbleFlowRate*d;
	  dv[c][k]+=velocities[i][k];
	}
  }

  dispersions.assign(ncomponents, 0.);
  vector <double> sum2(ncomponents, 0.);
  for(MEGAInt i=0;i<np;i++)
  {
	MEGAInt c=partition[i];
	for(int k=0;k<3;k++)
	{
	  double d=velocities[i][k]-dv[c][k]/count[c];
	  sum2[c]+=d*d;
	}
  }
  for(MEGAInt c=0;c<ncomponents;c++)
	dispersions[c]=sqrt(sum2[c]/count[c]);
}

RefinementResult_t PhaseSpaceRefiner_t::Refine(const vector <Particle_t> &particles) const
{
  RefinementResult_t result;
  MEGAInt np=particles.size();
  vector <MEGAInt> partition(np, 0);//the whole host to begin with
  MEGAInt ncomponents=np>0?1:0;

  int niter=MaxIterations();
  if(np>1&&niter>0)
  {
	vector <Pair_t> pairs;
	FindSpatialPairs(particles, pairs);
	vector <MEGAxyz> velocities;
	vector <MEGAReal> dispersions;
	vector <MEGAInt> newpartition;
	for(int iter=0;iter<niter;iter++)
	{
	  MEGAReal alpha=Alpha(iter);
	  result.AlphaSequence.push_back(alpha);
	  result.Iterations++;

	  HubbleVelocities(particles, partition, ncomponents, velocities, dispersions);
	  DisjointSet_t sets(np);
	  for(auto &&p: pairs)
	  {
		MEGAInt c=partition[p.i];
		if(c!=partition[p.j]) continue;
		MEGAReal vlink=alpha*dispersions[c];
		if(Distance(velocities[p.i], velocities[p.j])<=vlink)
		  sets.Union(p.i, p.j);
	  }
	  MEGAInt nnew=sets.CompactLabels(newpartition);
	  if(newpartition==partition)
	  {
		result.Converged=true;
		break;
	  }
	  partition.swap(newpartition);
	  ncomponents=nnew;
	}
  }
  else if(np>0)
	result.Converged=(niter>0);

  result.Components.assign(ncomponents, vector <MEGAInt>());
  for(MEGAInt i=0;i<np;i++)
	result.Components[partition[i]].push_back(i);
  return result;
}
