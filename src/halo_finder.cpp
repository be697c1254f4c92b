#include <iostream>
#include <algorithm>

#include "halo_finder.h"
#include "config_parser.h"
#include "domain_decomposer.h"
#include "fof_builder.h"
#include "phase_space_refiner.h"
#include "halo_catalog_builder.h"

void HaloFinder_t::RefineHalos(ProvisionalHaloList_t &provisional, const Cosmology_t &cosmology, MEGAReal sub_linklength, vector <vector <Particle_t> > &candidates)
/*the provisional halos are consumed; their velocity-coherent components become halo candidates*/
{
  PhaseSpaceRefiner_t refiner(MEGAConfig.IniAlphaV, MEGAConfig.MinAlphaV, MEGAConfig.AlphaDecrement, sub_linklength, cosmology.HubbleFlowRate());
  MEGAInt nhalos=provisional.size();
  vector <vector <vector <Particle_t> > > components(nhalos);
  MEGAInt nsplit=0, nexhausted=0;
  #pragma omp parallel for schedule(dynamic,1) reduction(+:nsplit,nexhausted)
  for(MEGAInt i=0;i<nhalos;i++)
  {
	auto &particles=provisional[i].Particles;
	RefinementResult_t result=refiner.Refine(particles);
	if(!result.Converged) nexhausted++;
	if(result.Components.size()>1) nsplit++;
	for(auto &&comp: result.Components)
	{
	  if((MEGAInt)comp.size()<MEGAConfig.MinNumPartOfProvisionalHalo) continue;
	  components[i].emplace_back();
	  auto &members=components[i].back();
	  members.reserve(comp.size());
	  for(auto &&j: comp)
		members.push_back(particles[j]);
	}
	vector <Particle_t>().swap(particles);
  }
  provisional.clear();

  Stats.NumSplit+=nsplit;
  Stats.NumExhausted+=nexhausted;
  candidates.clear();
  for(auto &&c: components)
	for(auto &&members: c)
	{
	  candidates.emplace_back();
	  candidates.back().swap(members);
	}
}

void HaloFinder_t::Find(MpiWorker_t &world, ParticleSnapshot_t &partsnap, const HaloSnapshot_t *prior, HaloSnapshot_t &catalog, Timer_t &timer)
{
  Stats=FinderStats_t();
  MEGAReal linkl=partsnap.LinkingLength();
  if(MEGAConfig.UseMPI)
  {
	DomainDecomposer_t decomposer(world.size(), MEGAConfig.BoxSize, linkl, MEGAConfig.PeriodicBoundaryOn);
	decomposer.Decompose(world, partsnap.Particles, partsnap.MPI_MEGA_Particle);
  }
  else
	sort(partsnap.Particles.begin(), partsnap.Particles.end(), CompParticleId);
  if(MEGAConfig.Verbose)
  {
	MEGAInt nowned=partsnap.CountOwned(world.rank());
	cout<<"rank "<<world.rank()<<": "<<nowned<<" owned and "<<partsnap.size()-nowned<<" ghost particles\n";
  }
  timer.Tick(world.Communicator);

  FoFBuilder_t builder(linkl, partsnap.Particles, MEGAConfig.BatchSize, MEGAConfig.NumberOfCells);
  builder.Link();
  MEGAInt ngroups=count_if(builder.GrpLen.begin(), builder.GrpLen.end(), [](MEGAInt n){return n>1;});
  MPI_Allreduce(&ngroups, &Stats.NumGroups, 1, MPI_MEGA_INT, MPI_SUM, world.Communicator);
  timer.Tick(world.Communicator);

  ProvisionalHaloList_t provisional;
  {
	BoundaryReconciler_t reconciler;
	reconciler.Reconcile(world, partsnap.Particles, builder.GrpTags, builder.GrpLen, partsnap.MPI_MEGA_Particle, provisional);
  }
  MEGAInt nprovisional=provisional.size();
  MPI_Allreduce(&nprovisional, &Stats.NumProvisional, 1, MPI_MEGA_INT, MPI_SUM, world.Communicator);
  timer.Tick(world.Communicator);

  vector <vector <Particle_t> > candidates;
  RefineHalos(provisional, partsnap.Cosmology, partsnap.SubLinkingLength(), candidates);
  MPI_Allreduce(MPI_IN_PLACE, &Stats.NumSplit, 1, MPI_MEGA_INT, MPI_SUM, world.Communicator);
  MPI_Allreduce(MPI_IN_PLACE, &Stats.NumExhausted, 1, MPI_MEGA_INT, MPI_SUM, world.Communicator);
  MEGAInt ncandidates=candidates.size();
  MPI_Allreduce(&ncandidates, &Stats.NumCandidates, 1, MPI_MEGA_INT, MPI_SUM, world.Communicator);
  timer.Tick(world.Communicator);

  catalog.Clear();
  catalog.SnapshotIndex=partsnap.SnapshotIndex;
  catalog.SnapshotName=partsnap.SnapshotName;
  catalog.Cosmology=partsnap.Cosmology;
  catalog.LinkingLength=linkl;
  CatalogBuilder_t catalog_builder(MEGAConfig.PartThreshold, MEGAConfig.MaxSampleSizeOfPotentialEstimate);
  Stats.NumDropped=catalog_builder.Build(world, candidates, prior, catalog);
  timer.Tick(world.Communicator);
}

void HaloFinder_t::PrintStats(MpiWorker_t &world) const
{
  if(world.rank()!=0) return;
  cout<<"  "<<Stats.NumGroups<<" local FoF groups, "<<Stats.NumProvisional<<" provisional halos after reconciliation\n";
  cout<<"  refinement split "<<Stats.NumSplit<<" of them into "<<Stats.NumCandidates<<" candidates";
  if(Stats.NumExhausted)
	cout<<"; "<<Stats.NumExhausted<<" stopped at min_alpha_v without converging";
  cout<<endl;
  cout<<"  "<<Stats.NumDropped<<" candidates dropped below part_threshold"<<endl;
}
