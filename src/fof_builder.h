#ifndef FOF_BUILDER_H_INCLUDED
#define FOF_BUILDER_H_INCLUDED

#include "kd_tree.h"
#include "cell_grid.h"
#include "disjoint_set.h"

class FoFBuilder_t
/*friends-of-friends linking of a set of particles with a fixed linking length.
 * queries run cell by cell, BatchSize at a time, each batch searched in parallel.*/
{
private:
  const vector <Particle_t> &Particles;
  ParticlePos_t PosData;
  KDTree_t Tree;
  CellGrid_t Grid;
  MEGAInt BatchSize;
public:
  vector <MEGAInt> GrpLen, GrpTags;
  MEGAReal LinkLength;
  FoFBuilder_t(MEGAReal linklength, const vector <Particle_t> &particles, MEGAInt batchsize, MEGAInt ncells);
  /*fills GrpTags (0~Ngroups-1, in order of the first member) and GrpLen, down to singletons*/
  MEGAInt Link();
};

#endif
