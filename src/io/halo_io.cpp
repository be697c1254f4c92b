#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <algorithm>
#include <cstdlib>
#include <cstdio>
#include <cmath>

#include "../mymath.h"
#include "../halo.h"
#include "../hdf_wrapper.h"

void HaloSnapshot_t::BuildHDFDataType()
{
  H5T_HaloInMem=H5Tcreate(H5T_COMPOUND, sizeof (Halo_t));
  hsize_t dims[1]={3};
  hid_t H5T_MEGAxyz=H5Tarray_create2(H5T_MEGAReal, 1, dims);
  hid_t H5T_FloatVec3=H5Tarray_create2(H5T_NATIVE_FLOAT, 1, dims);
  #define InsertMember(x,t) H5Tinsert(H5T_HaloInMem, #x, HOFFSET(Halo_t, x), t)
  InsertMember(HaloId, H5T_MEGAInt);
  InsertMember(GlobalId, H5T_MEGAInt);
  InsertMember(Nparticles, H5T_MEGAInt);
  InsertMember(SplitFrom, H5T_MEGAInt);
  InsertMember(ComovingAveragePosition, H5T_MEGAxyz);
  InsertMember(PhysicalAverageVelocity, H5T_MEGAxyz);
  InsertMember(KineticEnergy, H5T_NATIVE_FLOAT);
  InsertMember(GravitationalEnergy, H5T_NATIVE_FLOAT);
  InsertMember(TotalEnergy, H5T_NATIVE_FLOAT);
  InsertMember(RmsRadius, H5T_NATIVE_FLOAT);
  InsertMember(RmsVelocityRadius, H5T_NATIVE_FLOAT);
  InsertMember(VelDisp3D, H5T_NATIVE_FLOAT);
  InsertMember(VelDisp1D, H5T_FloatVec3);
  InsertMember(Vmax, H5T_NATIVE_FLOAT);
  InsertMember(HalfMassRadius, H5T_NATIVE_FLOAT);
  InsertMember(HalfMassVelocityRadius, H5T_NATIVE_FLOAT);
  InsertMember(Real, H5T_NATIVE_INT);
  #undef InsertMember
  H5T_HaloInDisk=H5Tcopy(H5T_HaloInMem);
  H5Tpack(H5T_HaloInDisk); //clear fields not added.
  H5Tclose(H5T_FloatVec3);
  H5Tclose(H5T_MEGAxyz);
}

string HaloSnapshot_t::GetFileName(const string &path, const string &basename, const string &snapshot_name)
{
  return path+basename+"_"+snapshot_name+".hdf5";
}

void HaloSnapshot_t::WriteFile(const string &filename)
/*write the halos held by this worker into a single file*/
{
  mkdir_for_path(filename);
  hid_t file=CreateHDFFile(filename);

  SetStringAttribute(file, ".", "snapshot_name", SnapshotName.c_str());
  SetAttribute(file, "snapshot_index", H5T_NATIVE_INT, &SnapshotIndex);
  SetAttribute(file, "boxsize", H5T_MEGAReal, &Cosmology.BoxSize);
  SetAttribute(file, "pmass", H5T_MEGAReal, &Cosmology.ParticleMass);
  SetAttribute(file, "h", H5T_MEGAReal, &Cosmology.HubbleParam);
  SetAttribute(file, "redshift", H5T_MEGAReal, &Cosmology.Redshift);
  SetAttribute(file, "npart", H5T_MEGAInt, &Cosmology.NumberOfParticlesInAll);
  SetAttribute(file, "mean_sep", H5T_MEGAReal, &Cosmology.MeanSeparation);
  SetAttribute(file, "linking_length", H5T_MEGAReal, &LinkingLength);
  MEGAInt nhalos=Halos.size();
  SetAttribute(file, "nhalos", H5T_MEGAInt, &nhalos);

  hsize_t ndim=1, dim_halo[1]={(hsize_t)nhalos};
  vector <hvl_t> vl(nhalos);
  vector <MEGAInt> IdBuffer;
  IdBuffer.reserve(CountParticles());
  for(MEGAInt i=0;i<nhalos;i++)
  {
	Halos[i].Nparticles=Halos[i].Particles.size();
	for(auto &&p: Halos[i].Particles)
	  IdBuffer.push_back(p.Id);
  }
  MEGAInt offset=0;
  for(MEGAInt i=0;i<nhalos;i++)
  {
	vl[i].len=Halos[i].Nparticles;
	vl[i].p=IdBuffer.data()+offset;
	offset+=Halos[i].Nparticles;
  }
  hid_t H5T_MEGAIntArr=H5Tvlen_create(H5T_MEGAInt);
  writeHDFmatrix(file, Halos.data(), "Halos", ndim, dim_halo, H5T_HaloInMem, H5T_HaloInDisk);
  writeHDFmatrix(file, vl.data(), "HaloParticles", ndim, dim_halo, H5T_MEGAIntArr);
  H5Tclose(H5T_MEGAIntArr);
  H5Fclose(file);
}

void HaloSnapshot_t::Save(MpiWorker_t &world, const string &filename)
/*gather the catalog on the first worker and write it there; the local halos are kept*/
{
  const int root=0;
  HaloList_t LocalHalos(Halos);
  GatherToRoot(world, root);
  if(world.rank()==root)
  {
	WriteFile(filename);
	cout<<Halos.size()<<" halos saved to "<<filename<<endl;
  }
  Halos.swap(LocalHalos);
}

inline void ReadCatalogAttribute(hid_t file, const char *name, hid_t dtype, void *buf, const string &filename)
{
  if(ReadAttribute(file, ".", name, dtype, buf)<0)
	throw runtime_error(string("missing attribute ")+name+" in "+filename);
}

void HaloSnapshot_t::ReadFile(const string &filename, bool load_particles)
{
  Clear();
  hid_t file=OpenHDFFile(filename, H5F_ACC_RDONLY);
  SnapshotName=GetStringAttribute(file, ".", "snapshot_name");
  ReadCatalogAttribute(file, "snapshot_index", H5T_NATIVE_INT, &SnapshotIndex, filename);
  ReadCatalogAttribute(file, "boxsize", H5T_MEGAReal, &Cosmology.BoxSize, filename);
  ReadCatalogAttribute(file, "pmass", H5T_MEGAReal, &Cosmology.ParticleMass, filename);
  ReadCatalogAttribute(file, "h", H5T_MEGAReal, &Cosmology.HubbleParam, filename);
  ReadCatalogAttribute(file, "npart", H5T_MEGAInt, &Cosmology.NumberOfParticlesInAll, filename);
  ReadCatalogAttribute(file, "mean_sep", H5T_MEGAReal, &Cosmology.MeanSeparation, filename);
  ReadCatalogAttribute(file, "linking_length", H5T_MEGAReal, &LinkingLength, filename);
  MEGAReal redshift;
  ReadCatalogAttribute(file, "redshift", H5T_MEGAReal, &redshift, filename);
  Cosmology.Set(redshift);

  hsize_t dims[1];
  hid_t dset=H5Dopen2(file, "Halos", H5P_DEFAULT);
  if(dset<0)
	throw runtime_error("missing Halos dataset in "+filename);
  GetDatasetDims(dset, dims);
  MEGAInt nhalos=dims[0];
  Halos.resize(nhalos);
  if(nhalos)
	H5Dread(dset, H5T_HaloInMem, H5S_ALL, H5S_ALL, H5P_DEFAULT, Halos.data());
  H5Dclose(dset);

  if(load_particles&&nhalos)
  {
	vector <hvl_t> vl(nhalos);
	hid_t H5T_MEGAIntArr=H5Tvlen_create(H5T_MEGAInt);
	dset=H5Dopen2(file, "HaloParticles", H5P_DEFAULT);
	if(dset<0)
	  throw runtime_error("missing HaloParticles dataset in "+filename);
	GetDatasetDims(dset, dims);
	if((MEGAInt)dims[0]!=nhalos)
	  throw runtime_error("HaloParticles and Halos differ in length in "+filename);
	H5Dread(dset, H5T_MEGAIntArr, H5S_ALL, H5S_ALL, H5P_DEFAULT, vl.data());
	for(MEGAInt i=0;i<nhalos;i++)
	{
	  auto &h=Halos[i];
	  MEGAInt *p=(MEGAInt *)(vl[i].p);
	  h.Particles.resize(vl[i].len);
	  for(size_t j=0;j<vl[i].len;j++)
		h.Particles[j]=Particle_t(p[j], SpecialConst::NullCoordinate, SpecialConst::NullCoordinate);
	}
	ReclaimVlenData(dset, H5T_MEGAIntArr, vl.data());
	H5Dclose(dset);
	H5Tclose(H5T_MEGAIntArr);
  }
  H5Fclose(file);
  TotNumberOfHalos=nhalos;
}

void HaloSnapshot_t::Load(MpiWorker_t &world, const string &filename, int root)
/*the whole catalog ends up on root; the other workers only get the header*/
{
  if(world.rank()==root)
	ReadFile(filename);
  else
	Clear();
  MPI_Bcast(&Cosmology, sizeof(Cosmology), MPI_BYTE, root, world.Communicator);
  world.SyncAtom(SnapshotIndex, MPI_INT, root);
  world.SyncContainer(SnapshotName, MPI_CHAR, root);
  world.SyncAtom(TotNumberOfHalos, MPI_MEGA_INT, root);
  world.SyncAtom(LinkingLength, MPI_MEGA_REAL, root);
  if(world.rank()==root)
	cout<<TotNumberOfHalos<<" halos loaded from "<<filename<<endl;
}
