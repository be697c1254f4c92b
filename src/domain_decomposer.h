#ifndef DOMAIN_DECOMPOSER_H_INCLUDED
#define DOMAIN_DECOMPOSER_H_INCLUDED

#include <vector>
#include "datatypes.h"
#include "mymath.h"
#include "mpi_wrapper.h"
#include "snapshot.h"

class DomainDecomposer_t
/*splits the box into a regular grid of one cell per worker. every particle goes to the worker owning
 * its cell, plus a ghost copy to every neighbouring cell it lies within Margin of (per axis).*/
{
public:
  vector <int> Dims;
  MEGAxyz Step;
  MEGAReal BoxSize;
  MEGAReal Margin;
  bool IsPeriodic;
  int NumberOfDomains;
  DomainDecomposer_t(int ndomains, MEGAReal boxsize, MEGAReal margin, bool periodic);
  int GetOwner(const MEGAxyz &pos) const
  {
	return AssignCell(pos, Step, Dims);
  }
  void GetGhostDomains(const MEGAxyz &pos, int owner, vector <int> &domains) const;
  void Assign(const vector <Particle_t> &particles, vector <vector <Particle_t> > &send) const;
  void Decompose(MpiWorker_t &world, vector <Particle_t> &particles, MPI_Datatype dtype) const;
};

#endif
