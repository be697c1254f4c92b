#ifndef HALO_CATALOG_BUILDER_H_INCLUDED
#define HALO_CATALOG_BUILDER_H_INCLUDED

#include "halo.h"

struct HaloOrderKey_t
{
  MEGAInt Nparticles;
  MEGAInt MinParticleId;
  MEGAInt Rank;
  MEGAInt LocalIndex;
};
/*larger halos first; equal sizes ordered by their smallest member id*/
inline bool CompHaloOrder(const HaloOrderKey_t &a, const HaloOrderKey_t &b)
{
  if(a.Nparticles!=b.Nparticles) return a.Nparticles>b.Nparticles;
  return a.MinParticleId<b.MinParticleId;
}

struct ParticleHalo_t
{
  MEGAInt ParticleId;
  MEGAInt HaloId;
};

class CatalogBuilder_t
/*turns the refined halos of all the workers into a catalog with global ids and properties*/
{
  MPI_Datatype MPI_MEGA_OrderKey, MPI_MEGA_ParticleHalo;
public:
  MEGAInt PartThreshold;
  MEGAInt MaxSampleSize;
  static const MEGAInt MaxRescueThreshold=20;
  CatalogBuilder_t(MEGAInt part_threshold, MEGAInt max_sample_size);
  ~CatalogBuilder_t();
  /*a halo below the threshold survives only with a small threshold and a real progenitor*/
  static bool KeepHalo(MEGAInt np, MEGAInt part_threshold, bool has_progenitor)
  {
	if(np>=part_threshold) return true;
	return part_threshold<MaxRescueThreshold&&has_progenitor;
  }
  bool NeedProgenitorCheck(MEGAInt np) const
  {
	return np<PartThreshold&&PartThreshold<MaxRescueThreshold;
  }
  void FindProgenitors(MpiWorker_t &world, const vector <vector <Particle_t> > &candidates, const HaloSnapshot_t *prior, vector <char> &has_progenitor) const;
  void AssignHaloIds(MpiWorker_t &world, HaloSnapshot_t &catalog) const;
  void CheckExclusiveMembership(MpiWorker_t &world, const HaloSnapshot_t &catalog) const;
  /*candidates are consumed. prior must have its particle hash filled, or be null. returns the number of dropped candidates over all workers.*/
  MEGAInt Build(MpiWorker_t &world, vector <vector <Particle_t> > &candidates, const HaloSnapshot_t *prior, HaloSnapshot_t &catalog) const;
};

/*false if no particle appears twice; otherwise pid is set to a repeated id*/
extern bool FindDuplicateMember(vector <ParticleHalo_t> &members, MEGAInt &pid);

#endif
