#ifndef BOUNDARY_RECONCILER_H_INCLUDED
#define BOUNDARY_RECONCILER_H_INCLUDED

#include <vector>
#include "datatypes.h"
#include "mpi_wrapper.h"
#include "snapshot.h"
#include "hash.h"

/* merges the local FoF components that share particles across domain boundaries.
 * every local component carries a global label (local group index plus the worker's offset).
 * a ghost that belongs to a linked component claims its particle on the owner; the owner's label and the
 * ghost's label are then the same halo. the merged halo is assembled on the worker owning its smallest label.*/

struct GhostClaim_t
{
  MEGAInt ParticleId;
  MEGAInt Label;
  GhostClaim_t(){};
  GhostClaim_t(MEGAInt pid, MEGAInt label): ParticleId(pid), Label(label)
  {
  }
};
struct LabelEdge_t
{
  MEGAInt LabelA;
  MEGAInt LabelB;
  LabelEdge_t(){};
  LabelEdge_t(MEGAInt a, MEGAInt b): LabelA(a), LabelB(b)
  {
  }
};

struct ProvisionalHalo_t
{
  MEGAInt Label;
  vector <Particle_t> Particles;//sorted by id
};
typedef vector <ProvisionalHalo_t> ProvisionalHaloList_t;

class LabelResolver_t
/*connected components of the label edges; each label maps to the smallest label in its component*/
{
  vector <MEGAInt> Labels;//sorted unique
  vector <MEGAInt> Roots;
public:
  void Resolve(const vector <LabelEdge_t> &edges);
  bool Contains(MEGAInt label) const;
  MEGAInt Root(MEGAInt label) const;
};

/*global label of every local particle from its local group tag*/
extern void AssignGlobalLabels(const vector <MEGAInt> &grptags, MEGAInt label_offset, vector <MEGAInt> &labels);
/*the worker that assigned a label, given the label offsets of all the workers*/
extern int LabelOwner(MEGAInt label, const vector <MEGAInt> &label_offsets);
extern void CollectGhostClaims(const vector <Particle_t> &particles, int thisrank, int nranks, const vector <MEGAInt> &labels, const vector <MEGAInt> &grptags, const vector <MEGAInt> &grplen, vector <vector <GhostClaim_t> > &claims);
extern void MatchGhostClaims(const vector <Particle_t> &particles, int thisrank, const vector <MEGAInt> &labels, const vector <GhostClaim_t> &claims, vector <LabelEdge_t> &edges);
extern void RouteOwnedParticles(const vector <Particle_t> &particles, int thisrank, int nranks, const vector <MEGAInt> &labels, const vector <MEGAInt> &grptags, const vector <MEGAInt> &grplen, const LabelResolver_t &resolver, const vector <MEGAInt> &label_offsets, vector <vector <Particle_t> > &outgoing);
extern void GroupProvisionalHalos(vector <Particle_t> &received, MEGAInt min_size, ProvisionalHaloList_t &halos);

class BoundaryReconciler_t
{
  MPI_Datatype MPI_MEGA_Claim, MPI_MEGA_Edge;
public:
  BoundaryReconciler_t();
  ~BoundaryReconciler_t();
  /*particles: owned and ghost particles of this worker; grptags, grplen: local FoF result.
   * on return, halos holds the complete provisional halos assigned to this worker.*/
  void Reconcile(MpiWorker_t &world, const vector <Particle_t> &particles, const vector <MEGAInt> &grptags, const vector <MEGAInt> &grplen, MPI_Datatype MPI_MEGA_Particle, ProvisionalHaloList_t &halos);
};

#endif
