#ifndef HALO_FINDER_H_INCLUDED
#define HALO_FINDER_H_INCLUDED

#include <vector>
#include "mymath.h"
#include "snapshot.h"
#include "halo.h"
#include "boundary_reconciler.h"

struct FinderStats_t
{
  MEGAInt NumGroups;//local FoF groups with at least two members, over all workers
  MEGAInt NumProvisional;//after reconciliation
  MEGAInt NumCandidates;//after refinement
  MEGAInt NumSplit;//provisional halos broken up by the refinement
  MEGAInt NumExhausted;//refinements stopped by the iteration limit
  MEGAInt NumDropped;
  FinderStats_t(): NumGroups(0), NumProvisional(0), NumCandidates(0), NumSplit(0), NumExhausted(0), NumDropped(0)
  {
  }
};

class HaloFinder_t
/*finds the halos of one snapshot: decomposition, FoF, boundary reconciliation, phase-space refinement and cataloguing.
 * the timer gets one tick after each of these steps.*/
{
public:
  FinderStats_t Stats;
  void Find(MpiWorker_t &world, ParticleSnapshot_t &partsnap, const HaloSnapshot_t *prior, HaloSnapshot_t &catalog, Timer_t &timer);
  void RefineHalos(ProvisionalHaloList_t &provisional, const Cosmology_t &cosmology, MEGAReal sub_linklength, vector <vector <Particle_t> > &candidates);
  void PrintStats(MpiWorker_t &world) const;
};

#endif
