#include "mpi_wrapper.h"
#include <sstream>

void MpiWorker_t::SyncAtomBool(bool& x, int root)
{
  char y;
  if(rank()==root)
	y=x;
  MPI_Bcast(&y, 1, MPI_CHAR, root, Communicator);
  x=y;
}
void MpiWorker_t::SyncVectorBool(vector< bool >& x, int root)
{
  vector <char> y;
  if(rank()==root)
	y.assign(x.begin(),x.end());
  SyncContainer(y, MPI_CHAR, root);
  if(rank()!=root)
	x.assign(y.begin(),y.end());
}

void MpiWorker_t::SyncVectorString(vector< string >& x, int root)
{
  string buffer;

  if(rank()==root)
  {
    ostringstream file;
    for(auto &s: x)
      file<<s<<'\n';
    buffer=file.str();
  }

  SyncContainer(buffer, MPI_CHAR, root);

  if(rank()!=root)
  {
    x.clear();
    istringstream file(buffer);
    string s;
    while(getline(file, s))
      x.push_back(s);
  }
}

MEGAInt MpiWorker_t::ExclusiveSum(MEGAInt n)
/*sum of n over all the workers before this one*/
{
  MEGAInt offset=0;
  MPI_Exscan(&n, &offset, 1, MPI_MEGA_INT, MPI_SUM, Communicator);
  if(WorkerId==0) offset=0;//undefined on the first worker
  return offset;
}

void My_Type_free(MPI_Datatype *datatype) {

  int finalized;
  MPI_Finalized(&finalized);
  if(!finalized)MPI_Type_free(datatype);

}
