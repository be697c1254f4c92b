#ifndef HALO_H_INCLUDED
#define HALO_H_INCLUDED

#include <climits>
#include <iostream>
#include <new>
#include <algorithm>
#include <numeric>
#include "hdf5.h"

#include "datatypes.h"
#include "snapshot.h"
#include "mpi_wrapper.h"
#include "hash.h"

class Halo_t
{
public:
  typedef vector <Particle_t> ParticleList_t;
  ParticleList_t Particles;//sorted by id
  MEGAInt HaloId;
  MEGAInt GlobalId;
  MEGAInt Nparticles;
  MEGAInt SplitFrom;//GlobalId of the halo this one was split from in a tree catalog; NullHaloId otherwise
  MEGAxyz ComovingAveragePosition;
  MEGAxyz PhysicalAverageVelocity;
  float KineticEnergy;//Msun km^2/s^2
  float GravitationalEnergy;//positive for bound
  float TotalEnergy;
  float RmsRadius;//comoving
  float RmsVelocityRadius;
  float VelDisp3D;
  float VelDisp1D[3];
  float Vmax;//km/s
  float HalfMassRadius;//comoving
  float HalfMassVelocityRadius;
  int Real;//1 if KE/GE<=1

  Halo_t(): Particles(), HaloId(SpecialConst::NullHaloId), GlobalId(SpecialConst::NullHaloId), Nparticles(0), SplitFrom(SpecialConst::NullHaloId)
  {
	ComovingAveragePosition=PhysicalAverageVelocity=SpecialConst::NullCoordinate;
	KineticEnergy=GravitationalEnergy=TotalEnergy=0.;
	RmsRadius=RmsVelocityRadius=VelDisp3D=Vmax=HalfMassRadius=HalfMassVelocityRadius=0.;
	VelDisp1D[0]=VelDisp1D[1]=VelDisp1D[2]=0.;
	Real=0;
  }
  MEGAInt MinParticleId() const
  {
	return Particles.empty()?SpecialConst::NullParticleId:Particles.front().Id;
  }
  void AverageCoordinates();
  void ComputeProperties(const Cosmology_t &cosmology, MEGAInt max_sample_size);
  double PotentialSum(MEGAReal softening, MEGAInt max_sample_size) const;
};
extern void create_MPI_Halo_type(MPI_Datatype &MPI_MEGAHalo_t);

class HaloSnapshot_t
/*a halo catalog of one snapshot. the halos may be distributed over the workers.*/
{
  typedef vector <Halo_t> HaloList_t;
  MPI_Datatype MPI_MEGA_Halo_t;//MPI datatype ignoring the particle list
  hid_t H5T_HaloInMem, H5T_HaloInDisk;
  void BuildMPIDataType();
  void BuildHDFDataType();
public:
  int SnapshotIndex;
  string SnapshotName;
  Cosmology_t Cosmology;
  MEGAReal LinkingLength;
  HaloList_t Halos;
  MEGAInt TotNumberOfHalos;//over all the workers
  MappedIndexTable_t<MEGAInt, MEGAInt> ParticleHash;//particle id to local halo index

  HaloSnapshot_t(): SnapshotIndex(SpecialConst::NullSnapshotId), SnapshotName(), Cosmology(), LinkingLength(0.), Halos(), TotNumberOfHalos(0), ParticleHash()
  {
	BuildMPIDataType();
	BuildHDFDataType();
  }
  ~HaloSnapshot_t()
  {
	My_Type_free(&MPI_MEGA_Halo_t);
	H5Tclose(H5T_HaloInDisk);
	H5Tclose(H5T_HaloInMem);
  }
  MEGAInt size() const
  {
	return Halos.size();
  }
  void Clear();
  void FillParticleHash();
  /*local index of the halo holding the particle, or NullHaloId*/
  MEGAInt GetHaloIndex(MEGAInt pid) const
  {
	return ParticleHash.GetIndex(pid);
  }
  MEGAInt CountParticles() const;
  void GatherToRoot(MpiWorker_t &world, int root);
  void Save(MpiWorker_t &world, const string &filename);
  void WriteFile(const string &filename);
  void ReadFile(const string &filename, bool load_particles=true);
  void Load(MpiWorker_t &world, const string &filename, int root=0);
  static string GetFileName(const string &path, const string &basename, const string &snapshot_name);
};

inline bool CompHaloId(const Halo_t &a, const Halo_t &b)
{
  return a.HaloId<b.HaloId;
}

#endif
