using namespace std;
#include <iostream>
#include <sstream>
#include <string>
#include <cstdlib>
#include <cstdio>
#include <cmath>

#include "../snapshot.h"
#include "../mymath.h"
#include "../hdf_wrapper.h"

string ParticleSnapshot_t::GetFileName(const string &snapshot_name)
{
  return MEGAConfig.DataPath+"mega_inputs_"+snapshot_name+".hdf5";
}

inline void ReadHeaderAttribute(hid_t file, const char *name, hid_t dtype, void *buf)
{
  if(ReadAttribute(file, ".", name, dtype, buf)<0)
	throw runtime_error(string("missing header attribute ")+name);
}

void ParticleSnapshot_t::ReadHeader(const string &filename)
{
  hid_t file=OpenHDFFile(filename, H5F_ACC_RDONLY);
  double x;
  ReadHeaderAttribute(file, "mean_sep", H5T_NATIVE_DOUBLE, &x);
  Cosmology.MeanSeparation=x;
  ReadHeaderAttribute(file, "boxsize", H5T_NATIVE_DOUBLE, &x);
  Cosmology.BoxSize=x;
  ReadHeaderAttribute(file, "npart", H5T_MEGAInt, &Cosmology.NumberOfParticlesInAll);
  ReadHeaderAttribute(file, "t", H5T_NATIVE_DOUBLE, &x);
  Cosmology.Time=x;
  ReadHeaderAttribute(file, "rhocrit", H5T_NATIVE_DOUBLE, &x);
  Cosmology.RhoCrit=x;
  ReadHeaderAttribute(file, "pmass", H5T_NATIVE_DOUBLE, &x);
  Cosmology.ParticleMass=x;
  ReadHeaderAttribute(file, "h", H5T_NATIVE_DOUBLE, &x);
  Cosmology.HubbleParam=x;
  ReadHeaderAttribute(file, "redshift", H5T_NATIVE_DOUBLE, &x);
  H5Fclose(file);
  if(Cosmology.HubbleParam<=0)
	throw runtime_error("non-positive h in "+filename);
  Cosmology.Set(x);
}

void ParticleSnapshot_t::Load(MpiWorker_t &world, int snapshot_index)
/*every worker reads a contiguous slice of the particle arrays, at most MaxConcurrentIO at a time*/
{
  Clear();
  SnapshotIndex=snapshot_index;
  SnapshotName=MEGAConfig.GetSnapshotName(snapshot_index);
  string filename=GetFileName(SnapshotName);

  const int root=0;
  if(world.rank()==root)
	ReadHeader(filename);
  MPI_Bcast(&Cosmology, sizeof(Cosmology), MPI_BYTE, root, world.Communicator);
  MEGAConfig.SetBoxSize(Cosmology.BoxSize);

  MEGAInt ibegin, iend;
  AssignTasks(world.rank(), world.size(), Cosmology.NumberOfParticlesInAll, ibegin, iend);
  MEGAInt np=iend-ibegin;
  Particles.resize(np);

  for(int i=0, ireader=0;i<world.size();i++, ireader++)
  {
	if(ireader==MEGAConfig.MaxConcurrentIO)
	{
	  ireader=0;//reset reader count
	  MPI_Barrier(world.Communicator);//wait for every thread to arrive.
	}
	if(i==world.rank()&&np>0)
	{
	  hid_t file=OpenHDFFile(filename, H5F_ACC_RDONLY);
	  {//the ids are stored as floating point numbers
		vector <double> id(np);
		if(ReadPartialDataset(file, "part_pid", H5T_NATIVE_DOUBLE, ibegin, np, id.data())<0)
		  throw runtime_error("failed to read part_pid from "+filename);
		for(MEGAInt j=0;j<np;j++)
		  Particles[j].Id=llround(id[j]);
	  }
	  {
		vector <MEGAxyz> x(np);
		if(ReadPartialDataset(file, "part_pos", H5T_MEGAReal, ibegin, np, x.data())<0)
		  throw runtime_error("failed to read part_pos from "+filename);
		for(MEGAInt j=0;j<np;j++)
		  for(int k=0;k<3;k++)
			Particles[j].ComovingPosition[k]=MEGAConfig.PeriodicBoundaryOn?position_modulus(x[j][k], Cosmology.BoxSize):x[j][k];
	  }
	  {
		vector <MEGAxyz> v(np);
		if(ReadPartialDataset(file, "part_vel", H5T_MEGAReal, ibegin, np, v.data())<0)
		  throw runtime_error("failed to read part_vel from "+filename);
		for(MEGAInt j=0;j<np;j++)
		  Particles[j].PhysicalVelocity=v[j];
	  }
	  H5Fclose(file);
	}
  }
  for(auto &&p: Particles)
  {
	p.OwnerRank=world.rank();
	p.HaloTag=SpecialConst::NullLabel;
  }

  if(world.rank()==root)
	cout<<"Snapshot "<<SnapshotName<<" ("<<SnapshotIndex<<") loaded: "<<Cosmology.NumberOfParticlesInAll<<" particles, z="<<Cosmology.Redshift<<", linking length "<<LinkingLength()<<endl;
}
