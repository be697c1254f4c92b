#include "hdf_wrapper.h"
#include <cstring>
#include <stdexcept>
#include <vector>

void writeHDFmatrix(hid_t file, const void * buf, const char * name, hsize_t ndim, const hsize_t *dims, hid_t dtype, hid_t dtype_file)
{
  hid_t dataspace = H5Screate_simple (ndim, dims, NULL);
  hid_t dataset= H5Dcreate2(file, name, dtype_file, dataspace, H5P_DEFAULT, H5P_DEFAULT,
                H5P_DEFAULT);
  if(dataset<0)
  {
	H5Sclose(dataspace);
	throw std::runtime_error(std::string("failed to create dataset ")+name);
  }
  if(!(NULL==buf||0==dims[0]))
  {
	herr_t status = H5Dwrite (dataset, dtype, H5S_ALL, H5S_ALL, H5P_DEFAULT, buf);
	if(status<0)
	{
	  const int bufsize=1024;
	  char grpname[bufsize],filename[bufsize];
	  H5Iget_name(file, grpname, bufsize);
	  H5Fget_name(file, filename, bufsize);
	  std::cerr<<"####ERROR WRITING "<<grpname<<"/"<<name<<" into "<<filename<<", error number "<<status<<std::endl<<std::flush;
	}
  }
  H5Dclose(dataset);
  H5Sclose(dataspace);
}

herr_t SetStringAttribute(hid_t loc_id, const char *obj_name, const char *attr_name, const char *content)
/* set string attribute named attr_name to object obj_name at loc_id.
 * if loc_id fully specifies the object, obj_name="."
 * content specifies the attribute content
 *
 * equivalent to H5LTset_attribute_string() function in H5LT
 */
{
     hid_t dataspace  = H5Screate(H5S_SCALAR);
     hid_t attr_type = H5Tcopy(H5T_C_S1);
     H5Tset_size(attr_type, strlen(content)+1);
     H5Tset_strpad(attr_type, H5T_STR_NULLTERM);
     hid_t attr = H5Acreate_by_name(loc_id, obj_name, attr_name, attr_type, dataspace, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
     herr_t status = H5Awrite(attr, attr_type, content);

     H5Sclose(dataspace);
     H5Tclose(attr_type);
     H5Aclose(attr);

  return status;
}

herr_t SetAttribute(hid_t loc_id, const char *attr_name, hid_t dtype, const void *content)
/* write a scalar attribute to the object loc_id*/
{
  hid_t dataspace=H5Screate(H5S_SCALAR);
  hid_t attr=H5Acreate2(loc_id, attr_name, dtype, dataspace, H5P_DEFAULT, H5P_DEFAULT);
  herr_t status=H5Awrite(attr, dtype, content);
  H5Aclose(attr);
  H5Sclose(dataspace);
  return status;
}

std::string GetStringAttribute(hid_t loc_id, const char *obj_name, const char *attr_name)
{
  hid_t attr=H5Aopen_by_name(loc_id, obj_name, attr_name, H5P_DEFAULT, H5P_DEFAULT);
  if(attr<0)
	throw std::runtime_error(std::string("missing string attribute ")+attr_name);
  hid_t ftype=H5Aget_type(attr);
  size_t len=H5Tget_size(ftype);
  hid_t mtype=H5Tcopy(H5T_C_S1);
  H5Tset_size(mtype, len+1);
  std::vector <char> buf(len+1, '\0');
  H5Aread(attr, mtype, buf.data());
  H5Tclose(mtype);
  H5Tclose(ftype);
  H5Aclose(attr);
  return std::string(buf.data());
}

hid_t OpenHDFFile(const std::string &filename, unsigned flags)
{
  hid_t file=H5Fopen(filename.c_str(), flags, H5P_DEFAULT);
  if(file<0)
	throw std::runtime_error("failed to open "+filename);
  return file;
}

hid_t CreateHDFFile(const std::string &filename)
{
  hid_t file=H5Fcreate(filename.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
  if(file<0)
	throw std::runtime_error("failed to create "+filename);
  return file;
}

herr_t ReadPartialDataset(hid_t file, const char *name, hid_t dtype, hsize_t row_begin, hsize_t nrow, void *buf)
/* read rows [row_begin, row_begin+nrow) of a 1d or 2d dataset into buf*/
{
  hid_t dset=H5Dopen2(file, name, H5P_DEFAULT);
  if(dset<0)
  {
    std::cerr<<"####ERROR OPENING dataset "<<name<<std::endl<<std::flush;
    return dset;
  }
  hsize_t dims[2]={0,1};
  int ndim=GetDatasetDims(dset, dims);
  hsize_t start[2]={row_begin, 0}, count[2]={nrow, ndim>1?dims[1]:1};
  hid_t fspace=H5Dget_space(dset);
  H5Sselect_hyperslab(fspace, H5S_SELECT_SET, start, NULL, count, NULL);
  hid_t mspace=H5Screate_simple(ndim, count, NULL);
  herr_t status=H5Dread(dset, dtype, mspace, fspace, H5P_DEFAULT, buf);
  if(status<0)
    std::cerr<<"####ERROR READING rows "<<row_begin<<"+"<<nrow<<" of "<<name<<", error number "<<status<<std::endl<<std::flush;
  H5Sclose(mspace);
  H5Sclose(fspace);
  H5Dclose(dset);
  return status;
}
