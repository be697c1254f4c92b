#include <iostream>

#include "fof_builder.h"

class FoFLinker_t
{
  DisjointSet_t &Groups;
public:
  FoFLinker_t(DisjointSet_t &groups): Groups(groups)
  {
  }
  void operator()(MEGAInt i, const vector <MEGAInt> &friends)
  {
	for(auto &&j: friends)
	  Groups.Union(i, j);
  }
};

FoFBuilder_t::FoFBuilder_t(MEGAReal linklength, const vector <Particle_t> &particles, MEGAInt batchsize, MEGAInt ncells): Particles(particles), PosData(particles), Tree(), Grid(), BatchSize(batchsize), GrpLen(), GrpTags(), LinkLength(linklength)
{
  Tree.Build(PosData);
  Grid.Build(ncells, PosData);
}

MEGAInt FoFBuilder_t::Link()
{
  DisjointSet_t groups(Particles.size());
  FoFLinker_t linker(groups);
  vector <MEGAInt> order;
  Grid.GetQueryOrder(order);
  BatchedRadiusQuery(Tree, PosData, order, LinkLength, BatchSize, linker);

  MEGAInt ngroups=groups.CompactLabels(GrpTags);
  GrpLen.assign(ngroups, 0);
  for(auto &&tag: GrpTags)
	GrpLen[tag]++;
  return ngroups;
}
