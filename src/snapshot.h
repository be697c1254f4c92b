#ifndef SNAPSHOT_H_INCLUDED
#define SNAPSHOT_H_INCLUDED

#include <iostream>
#include <sstream>
#include <cstdlib>
#include <cstdio>

#include "datatypes.h"
#include "mymath.h"
#include "mpi_wrapper.h"
#include "config_parser.h"

struct Particle_t
{
  MEGAInt Id;
  MEGAxyz ComovingPosition;
  MEGAxyz PhysicalVelocity;
  int OwnerRank;//the worker whose domain contains this particle
  MEGAInt HaloTag;//scratch label carried through the exchanges
  Particle_t(){};//do nothing. this leaves the content uninitialized, for fast memory allocation.
  Particle_t(MEGAInt id, const MEGAxyz &pos, const MEGAxyz &vel): Id(id), ComovingPosition(pos), PhysicalVelocity(vel), OwnerRank(0), HaloTag(SpecialConst::NullLabel)
  {
  }
  void create_MPI_type(MPI_Datatype &dtype);
};
inline bool CompParticleId(const Particle_t &a, const Particle_t &b)
{
  return a.Id<b.Id;
}

struct Cosmology_t
/*header of a snapshot, plus the quantities derived from it*/
{
  MEGAReal Redshift;
  MEGAReal ScaleFactor;
  MEGAReal Time;
  MEGAReal RhoCrit;
  MEGAReal ParticleMass;//as stored in the header, in 1e10 Msun/h
  MEGAReal HubbleParam;//little h
  MEGAReal MeanSeparation;
  MEGAReal BoxSize;
  MEGAInt NumberOfParticlesInAll;

  //derived parameters:
  MEGAReal Hz; //current Hubble param in km/s/Mpc
  MEGAReal Softening;//comoving, in the position unit

  Cosmology_t(): Redshift(0.), ScaleFactor(1.), Time(0.), RhoCrit(0.), ParticleMass(0.), HubbleParam(1.), MeanSeparation(0.), BoxSize(0.), NumberOfParticlesInAll(0), Hz(0.), Softening(0.)
  {
  }
  void Set(MEGAReal redshift)
  {
	Redshift=redshift;
	ScaleFactor=1./(1.+redshift);
	Hz=MEGAConfig.HubbleParameter(redshift);
	if(NumberOfParticlesInAll>0)
	  Softening=0.05*BoxSize/pow((double)NumberOfParticlesInAll, 1./3.);
  }
  /*particle mass in Msun*/
  double ParticleMassInSolarMass() const
  {
	return ParticleMass*1e10/HubbleParam;
  }
  /*multiply a comoving separation by this to get the Hubble flow velocity in km/s*/
  MEGAReal HubbleFlowRate() const
  {
	return Hz*ScaleFactor/HubbleParam;
  }
  /*convert a comoving separation into physical km*/
  double ComovingToPhysicalKm() const
  {
	return PhysicalConst::MpcInKm/HubbleParam/(1.+Redshift);
  }
};

class ParticleSnapshot_t
/*the particles of one snapshot held by this worker: the ones it owns, plus the ghost copies
 * it holds from its neighbours after decomposition.*/
{
public:
  int SnapshotIndex;
  string SnapshotName;
  Cosmology_t Cosmology;
  vector <Particle_t> Particles;
  MPI_Datatype MPI_MEGA_Particle;

  ParticleSnapshot_t(): SnapshotIndex(SpecialConst::NullSnapshotId), SnapshotName(), Cosmology(), Particles()
  {
	Particle_t().create_MPI_type(MPI_MEGA_Particle);
  }
  ~ParticleSnapshot_t()
  {
	My_Type_free(&MPI_MEGA_Particle);
  }
  MEGAInt size() const
  {
	return Particles.size();
  }
  MEGAReal LinkingLength() const
  {
	return MEGAConfig.LinkCoeff*Cosmology.MeanSeparation;
  }
  MEGAReal SubLinkingLength() const
  {
	return MEGAConfig.SubLinkCoeff*Cosmology.MeanSeparation;
  }
  MEGAInt CountOwned(int thisrank) const;
  void Clear();

  void ReadHeader(const string &filename);
  void Load(MpiWorker_t &world, int snapshot_index);
  static string GetFileName(const string &snapshot_name);
};

/*relative velocity of target to ref, including the Hubble flow*/
inline void RelativeVelocity(const Cosmology_t &cosmology, const MEGAxyz& targetPos, const MEGAxyz& targetVel, const MEGAxyz& refPos, const MEGAxyz& refVel, MEGAxyz& relativeVel)
{
  MEGAxyz dx;
  MEGAxyz &dv=relativeVel;
  MEGAReal hubble=cosmology.HubbleFlowRate();
  for(int j=0;j<3;j++)
  {
	dx[j]=targetPos[j]-refPos[j];
	if(MEGAConfig.PeriodicBoundaryOn)  dx[j]=NEAREST(dx[j]);
	dv[j]=targetVel[j]-refVel[j];
	dv[j]+=hubble*dx[j];
  }
}
extern void AveragePosition(MEGAxyz & CoM, const Particle_t Particles[], const MEGAInt NumPart);
extern void AverageVelocity(MEGAxyz & CoV, const Particle_t Particles[], const MEGAInt NumPart);
#endif
