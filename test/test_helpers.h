#ifndef TEST_HELPERS_H_INCLUDED
#define TEST_HELPERS_H_INCLUDED

#include <cstdio>
#include <string>
#include <vector>
#include <unistd.h>

#include "config_parser.h"
#include "snapshot.h"
#include "hdf_wrapper.h"

/*a complete configuration for the tests that do not read a parameter file*/
inline void ResetTestConfig(MEGAReal boxsize=100., bool periodic=true)
{
  MEGAConfig=Parameter_t();
  MEGAConfig.H0=70.;
  MEGAConfig.OmegaM0=0.3;
  MEGAConfig.BatchSize=64;
  MEGAConfig.IniAlphaV=1.5;
  MEGAConfig.MinAlphaV=0.5;
  MEGAConfig.AlphaDecrement=0.25;
  MEGAConfig.LinkCoeff=0.2;
  MEGAConfig.SubLinkCoeff=0.2;
  MEGAConfig.PartThreshold=10;
  MEGAConfig.NumberOfCells=8;
  MEGAConfig.UseSerial=true;
  MEGAConfig.StageFlags[StageHalo]=true;
  MEGAConfig.PeriodicBoundaryOn=periodic;
  MEGAConfig.SetBoxSize(boxsize);
}

inline Particle_t MakeParticle(MEGAInt id, MEGAReal x, MEGAReal y, MEGAReal z, MEGAReal vx=0., MEGAReal vy=0., MEGAReal vz=0.)
{
  MEGAxyz pos={{x, y, z}}, vel={{vx, vy, vz}};
  return Particle_t(id, pos, vel);
}

/*a cubic lattice of n^3 particles with the given spacing around centre; ids start at first_id*/
inline void AddLattice(vector <Particle_t> &particles, MEGAInt first_id, const MEGAxyz &centre, int n, MEGAReal spacing, const MEGAxyz &vel)
{
  MEGAInt id=first_id;
  for(int i=0;i<n;i++)
	for(int j=0;j<n;j++)
	  for(int k=0;k<n;k++)
		particles.push_back(MakeParticle(id++, centre[0]+(i-(n-1)/2.)*spacing, centre[1]+(j-(n-1)/2.)*spacing, centre[2]+(k-(n-1)/2.)*spacing, vel[0], vel[1], vel[2]));
}

/*a fresh scratch directory, ending with a slash*/
inline string MakeScratchDir(const string &name)
{
  char buf[]="/tmp/mega_test_XXXXXX";
  char *dir=mkdtemp(buf);
  if(dir==NULL)
	throw runtime_error("cannot create a scratch directory");
  return string(dir)+"/"+name+"/";
}

/*a particle snapshot file of a 100 Mpc/h box as the loader expects it*/
inline void WriteInputSnapshot(const string &filename, const vector <Particle_t> &particles, double redshift)
{
  mkdir_for_path(filename);
  hid_t file=CreateHDFFile(filename);
  double mean_sep=2.5, boxsize=100., t=1./(1.+redshift), rhocrit=27.75, pmass=0.01, h=0.7;
  MEGAInt npart=particles.size();
  SetAttribute(file, "mean_sep", H5T_NATIVE_DOUBLE, &mean_sep);
  SetAttribute(file, "boxsize", H5T_NATIVE_DOUBLE, &boxsize);
  SetAttribute(file, "npart", H5T_MEGAInt, &npart);
  SetAttribute(file, "redshift", H5T_NATIVE_DOUBLE, &redshift);
  SetAttribute(file, "t", H5T_NATIVE_DOUBLE, &t);
  SetAttribute(file, "rhocrit", H5T_NATIVE_DOUBLE, &rhocrit);
  SetAttribute(file, "pmass", H5T_NATIVE_DOUBLE, &pmass);
  SetAttribute(file, "h", H5T_NATIVE_DOUBLE, &h);

  vector <double> pid(npart);
  vector <MEGAxyz> pos(npart), vel(npart);
  for(MEGAInt i=0;i<npart;i++)
  {
	pid[i]=particles[i].Id;
	pos[i]=particles[i].ComovingPosition;
	vel[i]=particles[i].PhysicalVelocity;
  }
  hsize_t dims[2]={(hsize_t)npart, 3};
  writeHDFmatrix(file, pid.data(), "part_pid", 1, dims, H5T_NATIVE_DOUBLE);
  writeHDFmatrix(file, pos.data(), "part_pos", 2, dims, H5T_MEGAReal);
  writeHDFmatrix(file, vel.data(), "part_vel", 2, dims, H5T_MEGAReal);
  H5Fclose(file);
}

#endif
