#ifndef PHASE_SPACE_REFINER_H_INCLUDED
#define PHASE_SPACE_REFINER_H_INCLUDED

#include <vector>
#include "datatypes.h"
#include "snapshot.h"

struct RefinementResult_t
{
  vector <vector <MEGAInt> > Components;//indices into the input particles, one list per final component
  vector <MEGAReal> AlphaSequence;//alpha_v of every iteration run
  int Iterations;
  bool Converged;//false if the iteration limit was reached first
  RefinementResult_t(): Components(), AlphaSequence(), Iterations(0), Converged(false)
  {
  }
};

class PhaseSpaceRefiner_t
/* splits a provisional halo by linking, within each current component, only the particle pairs that are
 * both within SubLinkLength in space and within alpha_v times the component's velocity dispersion in velocity.
 * alpha_v starts at IniAlpha and drops by Decrement every iteration; the partition can only be split further.
 * stops when the partition no longer changes or after MaxIterations().*/
{
public:
  MEGAReal IniAlpha, MinAlpha, Decrement;
  MEGAReal SubLinkLength;
  MEGAReal HubbleFlowRate;//km/s per unit comoving separation
  PhaseSpaceRefiner_t(MEGAReal ini_alpha, MEGAReal min_alpha, MEGAReal decrement, MEGAReal sublinklength, MEGAReal hubble_flow_rate): IniAlpha(ini_alpha), MinAlpha(min_alpha), Decrement(decrement), SubLinkLength(sublinklength), HubbleFlowRate(hubble_flow_rate)
  {
  }
  static int MaxIterations(MEGAReal ini_alpha, MEGAReal min_alpha, MEGAReal decrement);
  int MaxIterations() const
  {
	return MaxIterations(IniAlpha, MinAlpha, Decrement);
  }
  MEGAReal Alpha(int iteration) const
  {
	return IniAlpha-iteration*Decrement;
  }
  RefinementResult_t Refine(const vector <Particle_t> &particles) const;
private:
  struct Pair_t
  {
	MEGAInt i, j;
  };
  void FindSpatialPairs(const vector <Particle_t> &particles, vector <Pair_t> &pairs) const;
  void HubbleVelocities(const vector <Particle_t> &particles, const vector <MEGAInt> &partition, MEGAInt ncomponents, vector <MEGAxyz> &velocities, vector <MEGAReal> &dispersions) const;
};

#endif
