#include <iostream>
#include <string>
#include <cerrno>
#include <stdexcept>
#include <sys/stat.h>

#include "mymath.h"

int GetGrid(MEGAReal x, MEGAReal step, int dim)
{
  int i=floor(x/step);
  if(i<0) i=0;
  if(i>=dim) i=dim-1;
  return i;
}
int AssignCell(const MEGAxyz & Pos, const MEGAxyz &step, const vector <int> &dims)
{
  #define GRIDtoRank(g0,g1,g2) (((g0)*dims[1]+(g1))*dims[2]+(g2))
  #define GID(i) GetGrid(Pos[i], step[i], dims[i])
  return GRIDtoRank(GID(0), GID(1), GID(2));
#undef GID
#undef GRIDtoRank
}

int LargestRootFactor(int N, int dim)
/*find an integer factor of N that is the largest subject to x<=N**(1./dim)*/
{
  int x=floor(pow(N, 1./dim)+1e-6);
  for(;x>0;x--)
	if(N%x==0) break;
  return x;
}
vector <int> ClosestFactors(int N, int dim)
/* return a factorization of `N` into `dim` factors that are as close as possible to each other*/
{
  vector <int> factors;
  for(;dim>0;dim--)
  {
	int x=LargestRootFactor(N, dim);
	factors.push_back(x);
	N/=x;
  }
  return factors;
}

void AssignTasks(MEGAInt worker_id, MEGAInt nworkers, MEGAInt ntasks, MEGAInt &task_begin, MEGAInt &task_end)
/*distribute ntasks to nworkers approximately fairly (equally if possible, otherwise the leading workers do one more task than others).
 * return the tasks assigned to worker_id as [task_begin, task_end).
 * worker_id is in the range [0, nworkers).*/
{
  MEGAInt ntask_remainder=ntasks%nworkers;
  MEGAInt ntask_this=ntasks/nworkers;
  task_begin=ntask_this*worker_id+min(ntask_remainder, worker_id);//distribute remainder to leading nodes
  if(worker_id<ntask_remainder)
	ntask_this++;
  task_end=ntask_this+task_begin;
}

void mkdir_for_path(const string &path)
/*create every directory leading to path. the part after the last '/' is a file basename and is not created.*/
{
  size_t pos=path.find('/', 1);
  while(pos!=string::npos)
  {
	string dir=path.substr(0, pos);
	if(mkdir(dir.c_str(), 0755)!=0&&errno!=EEXIST)
	  throw runtime_error("failed to create directory "+dir);
	pos=path.find('/', pos+1);
  }
}
