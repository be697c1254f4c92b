#include <catch2/catch.hpp>
#include <algorithm>

#include "boundary_reconciler.h"
#include "domain_decomposer.h"
#include "fof_builder.h"
#include "test_helpers.h"

TEST_CASE("labels map back to the worker that assigned them", "[reconcile]")
{
  vector <MEGAInt> offsets={0, 5, 5, 9};//worker 1 found nothing
  CHECK(LabelOwner(0, offsets)==0);
  CHECK(LabelOwner(4, offsets)==0);
  CHECK(LabelOwner(5, offsets)==2);
  CHECK(LabelOwner(8, offsets)==2);
  CHECK(LabelOwner(20, offsets)==3);
}

TEST_CASE("label edges resolve to the smallest label", "[reconcile]")
{
  vector <LabelEdge_t> edges={LabelEdge_t(3, 10), LabelEdge_t(10, 12), LabelEdge_t(1, 4)};
  LabelResolver_t resolver;
  resolver.Resolve(edges);
  CHECK(resolver.Root(12)==3);
  CHECK(resolver.Root(10)==3);
  CHECK(resolver.Root(4)==1);
  CHECK(resolver.Root(7)==7);
  CHECK(resolver.Contains(12));
  CHECK_FALSE(resolver.Contains(7));
}

TEST_CASE("a halo split by a domain boundary is reassembled once", "[reconcile]")
{
  ResetTestConfig(100., true);
  const int nranks=2;
  const MEGAReal linkl=0.6;
  DomainDecomposer_t decomposer(nranks, 100., linkl, true);
  REQUIRE(decomposer.Dims==vector<int>({1, 1, 2}));

  vector <Particle_t> all;
  MEGAxyz vel={{0., 0., 0.}};
  AddLattice(all, 0, MEGAxyz{{20., 20., 50.}}, 3, 0.5, vel);//straddles z=50
  AddLattice(all, 100, MEGAxyz{{20., 20., 20.}}, 3, 0.5, vel);//inside domain 0
  AddLattice(all, 200, MEGAxyz{{70., 70., 80.}}, 2, 0.5, vel);//inside domain 1

  vector <vector <Particle_t> > local;
  decomposer.Assign(all, local);
  for(auto &&v: local)
	sort(v.begin(), v.end(), CompParticleId);

  vector <vector <MEGAInt> > grptags(nranks), grplen(nranks), labels(nranks);
  vector <MEGAInt> label_offsets(nranks, 0);
  for(int r=0;r<nranks;r++)
  {
	FoFBuilder_t builder(linkl, local[r], 8, 8);
	builder.Link();
	grptags[r]=builder.GrpTags;
	grplen[r]=builder.GrpLen;
	if(r+1<nranks) label_offsets[r+1]=label_offsets[r]+grplen[r].size();
	AssignGlobalLabels(grptags[r], label_offsets[r], labels[r]);
  }

  vector <vector <vector <GhostClaim_t> > > claims(nranks);
  for(int r=0;r<nranks;r++)
	CollectGhostClaims(local[r], r, nranks, labels[r], grptags[r], grplen[r], claims[r]);
  CHECK(claims[0][1].size()>0);
  CHECK(claims[1][0].size()>0);

  vector <LabelEdge_t> edges;
  for(int dest=0;dest<nranks;dest++)
	for(int src=0;src<nranks;src++)
	  MatchGhostClaims(local[dest], dest, labels[dest], claims[src][dest], edges);
  REQUIRE_FALSE(edges.empty());
  LabelResolver_t resolver;
  resolver.Resolve(edges);

  vector <vector <Particle_t> > received(nranks);
  for(int r=0;r<nranks;r++)
  {
	vector <vector <Particle_t> > outgoing;
	RouteOwnedParticles(local[r], r, nranks, labels[r], grptags[r], grplen[r], resolver, label_offsets, outgoing);
	for(int d=0;d<nranks;d++)
	  received[d].insert(received[d].end(), outgoing[d].begin(), outgoing[d].end());
  }

  vector <ProvisionalHaloList_t> halos(nranks);
  for(int r=0;r<nranks;r++)
	GroupProvisionalHalos(received[r], 2, halos[r]);

  REQUIRE(halos[0].size()==2);
  REQUIRE(halos[1].size()==1);
  vector <MEGAInt> sizes;
  for(auto &&h: halos[0])
	sizes.push_back(h.Particles.size());
  sort(sizes.begin(), sizes.end());
  CHECK(sizes==vector<MEGAInt>({27, 27}));
  CHECK(halos[1][0].Particles.size()==8);

  for(auto &&h: halos[0])
	if(h.Particles.front().Id==0)
	  for(MEGAInt i=0;i<27;i++)
		CHECK(h.Particles[i].Id==i);
}

TEST_CASE("a ghost claimed on a worker that does not own it is a contract violation", "[reconcile]")
{
  vector <Particle_t> particles={MakeParticle(1, 1., 1., 1.)};
  particles[0].OwnerRank=0;
  vector <MEGAInt> labels={0};
  vector <GhostClaim_t> claims={GhostClaim_t(42, 3)};
  vector <LabelEdge_t> edges;
  CHECK_THROWS_AS(MatchGhostClaims(particles, 0, labels, claims, edges), logic_error);
}

TEST_CASE("reconciliation on a single worker returns the FoF groups", "[reconcile]")
{
  ResetTestConfig(100., true);
  MpiWorker_t world(MPI_COMM_SELF);
  ParticleSnapshot_t snap;
  MEGAxyz vel={{0., 0., 0.}};
  AddLattice(snap.Particles, 0, MEGAxyz{{10., 10., 10.}}, 2, 0.5, vel);
  snap.Particles.push_back(MakeParticle(50, 60., 60., 60.));
  FoFBuilder_t builder(0.6, snap.Particles, 8, 8);
  builder.Link();
  ProvisionalHaloList_t halos;
  BoundaryReconciler_t reconciler;
  reconciler.Reconcile(world, snap.Particles, builder.GrpTags, builder.GrpLen, snap.MPI_MEGA_Particle, halos);
  REQUIRE(halos.size()==1);
  CHECK(halos[0].Particles.size()==8);
}
