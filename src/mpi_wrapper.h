#ifndef MEGA_MPI_WRAPPER_H
#define MEGA_MPI_WRAPPER_H

#include <mpi.h>
#include <string>
#include <vector>
#include <stdexcept>
#include <climits>
#include <numeric>

#include "datatypes.h"
#include "mymath.h"

class MpiWorker_t
{
public:
  int  NumberOfWorkers, WorkerId, NameLen;
  char HostName[MPI_MAX_PROCESSOR_NAME];
  MPI_Comm Communicator; //do not use reference
  MpiWorker_t(MPI_Comm comm): Communicator(comm)
  {
	MPI_Comm_size(comm,&NumberOfWorkers);
	MPI_Comm_rank(comm,&WorkerId);
	MPI_Get_processor_name(HostName, &NameLen);
  }
  int size() const
  {
	return NumberOfWorkers;
  }
  int rank() const
  {
	return WorkerId;
  }
  template <class T>
  void SyncContainer(T &x, MPI_Datatype dtype, int root_worker);
  template <class T>
  void SyncAtom(T &x, MPI_Datatype dtype, int root_worker);
  void SyncAtomBool(bool &x, int root);
  void SyncVectorBool(vector <bool>&x, int root);
  void SyncVectorString(vector <string>&x, int root);
  MEGAInt ExclusiveSum(MEGAInt n);
};

template <class T>
void MpiWorker_t::SyncContainer(T &x, MPI_Datatype dtype, int root_worker)
{
  int len;

  if(root_worker==WorkerId)
  {
	if(x.size()>=INT_MAX)
	throw runtime_error("Error: in SyncContainer(), sending more than INT_MAX elements with MPI causes overflow.\n");
	len=x.size();
  }
  MPI_Bcast(&len, 1, MPI_INT, root_worker, Communicator);

  if(root_worker!=WorkerId)
	x.resize(len);
  MPI_Bcast((void *)x.data(), len, dtype, root_worker, Communicator);
};
template <class T>
inline void MpiWorker_t::SyncAtom(T& x, MPI_Datatype dtype, int root_worker)
{
  MPI_Bcast(&x, 1, dtype, root_worker, Communicator);
}

template <class T>
void VectorAllToAll(MpiWorker_t &world, vector < vector<T> > &SendVecs, vector < vector <T> > &ReceiveVecs, MPI_Datatype dtype)
{
  vector <int> SendSizes(world.size()), ReceiveSizes(world.size());
  for(int i=0;i<world.size();i++)
	SendSizes[i]=SendVecs[i].size();
  MPI_Alltoall(SendSizes.data(), 1, MPI_INT, ReceiveSizes.data(), 1, MPI_INT, world.Communicator);

  ReceiveVecs.resize(world.size());
  for(int i=0;i<world.size();i++)
	ReceiveVecs[i].resize(ReceiveSizes[i]);

  vector <MPI_Datatype> SendTypes(world.size()), ReceiveTypes(world.size());
  for(int i=0;i<world.size();i++)
  {
	MPI_Aint p;
	MPI_Get_address(SendVecs[i].data(), &p);
	MPI_Type_create_hindexed(1, &SendSizes[i], &p, dtype, &SendTypes[i]);
	MPI_Type_commit(&SendTypes[i]);

	MPI_Get_address(ReceiveVecs[i].data(), &p);
	MPI_Type_create_hindexed(1, &ReceiveSizes[i], &p, dtype, &ReceiveTypes[i]);
	MPI_Type_commit(&ReceiveTypes[i]);
  }
  vector <int> Counts(world.size(),1), Disps(world.size(),0);
  MPI_Alltoallw(MPI_BOTTOM, Counts.data(), Disps.data(), SendTypes.data(),
				MPI_BOTTOM, Counts.data(), Disps.data(), ReceiveTypes.data(), world.Communicator);

  for(int i=0;i<world.size();i++)
  {
	MPI_Type_free(&SendTypes[i]);
	MPI_Type_free(&ReceiveTypes[i]);
  }
}

template <class T>
void VectorAllGather(MpiWorker_t &world, const vector <T> &LocalVec, vector <T> &GlobalVec, MPI_Datatype dtype)
/*concatenate LocalVec from every worker, ordered by rank, into GlobalVec on every worker*/
{
  int n=LocalVec.size();
  vector <int> Counts(world.size()), Disps;
  MPI_Allgather(&n, 1, MPI_INT, Counts.data(), 1, MPI_INT, world.Communicator);
  size_t ntot=CompileOffsets(Counts, Disps);
  if(ntot>=INT_MAX)
	throw runtime_error("Error: in VectorAllGather(), gathering more than INT_MAX elements with MPI causes overflow.\n");
  GlobalVec.resize(ntot);
  MPI_Allgatherv(LocalVec.data(), n, dtype, GlobalVec.data(), Counts.data(), Disps.data(), dtype, world.Communicator);
}

template <class T>
void VectorGather(MpiWorker_t &world, const vector <T> &LocalVec, vector <T> &GlobalVec, MPI_Datatype dtype, int root)
/*same as VectorAllGather, but GlobalVec is only filled at root*/
{
  int n=LocalVec.size();
  vector <int> Counts(world.size()), Disps;
  MPI_Gather(&n, 1, MPI_INT, Counts.data(), 1, MPI_INT, root, world.Communicator);
  if(world.rank()==root)
  {
	size_t ntot=CompileOffsets(Counts, Disps);
	if(ntot>=INT_MAX)
	  throw runtime_error("Error: in VectorGather(), gathering more than INT_MAX elements with MPI causes overflow.\n");
	GlobalVec.resize(ntot);
  }
  MPI_Gatherv(LocalVec.data(), n, dtype, GlobalVec.data(), Counts.data(), Disps.data(), dtype, root, world.Communicator);
}

/*
   Free an MPI type, but only if MPI has not been finalized.
   This is for use in object destructors which might be called
   after MPI has been finalized. If it has, the type has already
   been freed and we don't need to do anything.
*/
void My_Type_free(MPI_Datatype *datatype);
#endif
