#include <iostream>
#include <string>

#include "../mymath.h"
#include "../halo_linker.h"
#include "../hdf_wrapper.h"

string HaloLinker_t::GetFileName(const string &path, const string &basename, const string &snapshot_name)
{
  return path+basename+"_"+snapshot_name+".hdf5";
}

void HaloLinker_t::SaveLinks(const string &filename, int prog_snapshot, int desc_snapshot, const vector <DirectLink_t> &links)
{
  mkdir_for_path(filename);
  hid_t file=CreateHDFFile(filename);
  SetAttribute(file, "progenitor_snapshot_index", H5T_NATIVE_INT, &prog_snapshot);
  SetAttribute(file, "descendant_snapshot_index", H5T_NATIVE_INT, &desc_snapshot);
  MEGAInt nlinks=links.size();
  SetAttribute(file, "nlinks", H5T_MEGAInt, &nlinks);

  vector <MEGAInt> prog(nlinks), desc(nlinks), shared(nlinks);
  for(MEGAInt i=0;i<nlinks;i++)
  {
	prog[i]=links[i].ProgenitorId;
	desc[i]=links[i].DescendantId;
	shared[i]=links[i].SharedParticles;
  }
  hsize_t dims[1]={(hsize_t)nlinks};
  writeHDFmatrix(file, prog.data(), "ProgenitorHaloIds", 1, dims, H5T_MEGAInt);
  writeHDFmatrix(file, desc.data(), "DescendantHaloIds", 1, dims, H5T_MEGAInt);
  writeHDFmatrix(file, shared.data(), "SharedParticles", 1, dims, H5T_MEGAInt);
  H5Fclose(file);
}

void HaloLinker_t::LoadLinks(const string &filename, int &prog_snapshot, int &desc_snapshot, vector <DirectLink_t> &links)
{
  hid_t file=OpenHDFFile(filename, H5F_ACC_RDONLY);
  if(ReadAttribute(file, ".", "progenitor_snapshot_index", H5T_NATIVE_INT, &prog_snapshot)<0||
	 ReadAttribute(file, ".", "descendant_snapshot_index", H5T_NATIVE_INT, &desc_snapshot)<0)
  {
	H5Fclose(file);
	throw runtime_error("missing snapshot indices in "+filename);
  }
  hid_t dset=H5Dopen2(file, "ProgenitorHaloIds", H5P_DEFAULT);
  if(dset<0)
  {
	H5Fclose(file);
	throw runtime_error("missing ProgenitorHaloIds in "+filename);
  }
  hsize_t dims[1];
  GetDatasetDims(dset, dims);
  H5Dclose(dset);
  MEGAInt nlinks=dims[0];
  vector <MEGAInt> prog(nlinks), desc(nlinks), shared(nlinks);
  if(nlinks)
  {
	if(ReadDataset(file, "ProgenitorHaloIds", H5T_MEGAInt, prog.data())<0||
	   ReadDataset(file, "DescendantHaloIds", H5T_MEGAInt, desc.data())<0||
	   ReadDataset(file, "SharedParticles", H5T_MEGAInt, shared.data())<0)
	{
	  H5Fclose(file);
	  throw runtime_error("failed to read links from "+filename);
	}
  }
  H5Fclose(file);
  links.resize(nlinks);
  for(MEGAInt i=0;i<nlinks;i++)
	links[i]=DirectLink_t(prog[i], desc[i], shared[i]);
}
