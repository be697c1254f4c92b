#ifndef MYMATH_HEADER_INCLUDED
#define MYMATH_HEADER_INCLUDED

#include <iostream>

#include <cstdlib>
#include <cstdio>
#include <cmath>
#include <cstring>
#include <sys/stat.h>
#include <chrono>
#include <vector>
#include <algorithm>
#include <mpi.h>

#include "datatypes.h"

extern int GetGrid(MEGAReal x, MEGAReal step, int dim);
extern int AssignCell(const MEGAxyz & Pos, const MEGAxyz &step, const vector <int> &dims);

template <class T>
void VectorFree(vector <T> &x)
{
  vector <T>().swap(x);
}

template <class T, class T2>
size_t CompileOffsets(const vector <T> &Counts, vector <T2> &Offsets)
{
  size_t offset=0;
  Offsets.resize(Counts.size());
  for(size_t i=0;i<Counts.size();i++)
  {
	Offsets[i]=offset;
	offset+=Counts[i];
  }
  return offset;
}

class Timer_t
{
public:
  vector <chrono::high_resolution_clock::time_point> tickers;
  Timer_t()
  {
	tickers.reserve(20);
  }
  void Tick()
  {
	tickers.push_back(chrono::high_resolution_clock::now());
  }
  void Tick(MPI_Comm comm)
  //synchronized tick. wait for all processes to tick together.
  {
	MPI_Barrier(comm);
	Tick();
  }
  void Reset()
  {
	tickers.clear();
  }
  size_t Size()
  {
	return tickers.size();
  }
  int FixTickNum(int itick)
  {
    return itick<0?itick+Size():itick;
  }
  double GetSeconds(int itick=-1)
  /*get the time spent from the previous tick to the current tick
   * if itick not specified, return the current interval
   * if itick<0, it will be interpreted as end()+itick */
  {
	itick=FixTickNum(itick);
	return GetSeconds(itick, itick-1);
  }
  double GetSeconds(int itick, int itick0)
  /*get the time spent from itick0 to itick*/
  {
    itick=FixTickNum(itick);
    itick0=FixTickNum(itick0);
    if(itick<itick0)
      swap(itick, itick0);

    return chrono::duration_cast<chrono::duration<double> >(tickers[itick]-tickers[itick0]).count();
  }
};

inline MEGAReal position_modulus(MEGAReal x, MEGAReal boxsize)
{//shift the positions to within [0,boxsize)
	MEGAReal y;
	if(x>=0&&x<boxsize) return x;
	y=x/boxsize;
	return (y-floor(y))*boxsize;
}
inline MEGAReal Distance2(const MEGAReal x[3], const MEGAReal y[3])
{
	MEGAxyz dx;
	dx[0]=x[0]-y[0];
	dx[1]=x[1]-y[1];
	dx[2]=x[2]-y[2];
	return dx[0]*dx[0]+dx[1]*dx[1]+dx[2]*dx[2];
}
inline MEGAReal Distance(const MEGAxyz &x, const MEGAxyz &y)
{
  return sqrt(Distance2(x.data(), y.data()));
}

extern int LargestRootFactor(int N, int dim);
extern vector <int> ClosestFactors(int N, int dim);
extern void AssignTasks(MEGAInt worker_id, MEGAInt nworkers, MEGAInt ntasks, MEGAInt &task_begin, MEGAInt &task_end);
extern void mkdir_for_path(const string &path);

#endif
