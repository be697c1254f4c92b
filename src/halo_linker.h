#ifndef HALO_LINKER_H_INCLUDED
#define HALO_LINKER_H_INCLUDED

#include <vector>
#include "halo.h"

/*a progenitor-descendant pair between consecutive snapshots, weighted by the number of shared particles*/
struct DirectLink_t
{
  MEGAInt ProgenitorId;//HaloId in the earlier snapshot
  MEGAInt DescendantId;//HaloId in the later snapshot
  MEGAInt SharedParticles;
  DirectLink_t(){};
  DirectLink_t(MEGAInt prog, MEGAInt desc, MEGAInt n): ProgenitorId(prog), DescendantId(desc), SharedParticles(n)
  {
  }
};
inline bool CompLinkPair(const DirectLink_t &a, const DirectLink_t &b)
{
  if(a.ProgenitorId!=b.ProgenitorId) return a.ProgenitorId<b.ProgenitorId;
  return a.DescendantId<b.DescendantId;
}

class HaloLinker_t
{
  MPI_Datatype MPI_MEGA_Membership, MPI_MEGA_Link;
public:
  HaloLinker_t();
  ~HaloLinker_t();
  /*both catalogs complete on this worker*/
  static void LinkSerial(const HaloSnapshot_t &progenitors, const HaloSnapshot_t &descendants, vector <DirectLink_t> &links);
  /*catalogs spread over the workers in any way; every worker gets the full link list*/
  void Link(MpiWorker_t &world, const HaloSnapshot_t &progenitors, const HaloSnapshot_t &descendants, vector <DirectLink_t> &links) const;
  static void SaveLinks(const string &filename, int prog_snapshot, int desc_snapshot, const vector <DirectLink_t> &links);
  static void LoadLinks(const string &filename, int &prog_snapshot, int &desc_snapshot, vector <DirectLink_t> &links);
  static string GetFileName(const string &path, const string &basename, const string &snapshot_name);
};

/*sum the weights of repeated pairs; the result is sorted by (progenitor, descendant)*/
extern void MergeLinks(vector <DirectLink_t> &links);

#endif
