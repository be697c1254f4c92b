#ifndef DATATYPES_INCLUDED

#include <iostream>
#include <cstring>
using namespace std;
#include <array>
#include <vector>

/*datatype for internal calculation and output*/
#ifdef MEGA_REAL8
typedef double MEGAReal;
#define MPI_MEGA_REAL MPI_DOUBLE
#else
typedef float MEGAReal;
#define MPI_MEGA_REAL MPI_FLOAT
#endif

// MEGAInt has to hold the number of particles as well as the global halo ids
#ifdef MEGA_INT8
typedef long MEGAInt;
#define MPI_MEGA_INT MPI_LONG
#else
typedef int MEGAInt;
#define MPI_MEGA_INT MPI_INT
#endif

typedef array <MEGAReal, 3> MEGAxyz;
inline void copyMEGAxyz(MEGAxyz &dest, const MEGAxyz &src)
{
  dest=src;
}

namespace SpecialConst
{
  const MEGAInt NullParticleId=-1;//reserved special id, should not be used by input simulation data
  const MEGAInt NullSnapshotId=-1;
  const MEGAInt NullHaloId=-1;//do not change this.
  const MEGAInt NullLabel=-1;
#ifdef MEGA_INT8
  const MEGAInt HaloIdStride=10000000000L;//GlobalId=SnapshotIndex*HaloIdStride+HaloId
#else
  const MEGAInt HaloIdStride=100000;
#endif

  const MEGAxyz NullCoordinate={0.,0.,0.};
};

class ParticleCollector_t
/*receives the particles located by a spatial search*/
{
public:
  virtual void Collect(MEGAInt index, MEGAReal d2)=0;
  virtual ~ParticleCollector_t()
  {}
};
class IndexCollector_t: public ParticleCollector_t
/*only keeps the index*/
{
public:
  vector <MEGAInt> Indices;
  void Collect(MEGAInt index, MEGAReal d2)
  {
	Indices.push_back(index);
  }
};

#define DATATYPES_INCLUDED
#endif
