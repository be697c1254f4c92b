#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <cmath>
#include <algorithm>

#include "mpi_wrapper.h"
#include "mymath.h"
#include "halo.h"

void create_MPI_Halo_type(MPI_Datatype &MPI_MEGAHalo_t)
{
/*to create the struct containing the halo without its particles*/
Halo_t p;
#define NumAttr 20
MPI_Datatype oldtypes[NumAttr];
int blockcounts[NumAttr];
MPI_Aint   offsets[NumAttr], origin,extent;

MPI_Get_address(&p,&origin);
MPI_Get_address((&p)+1,&extent);//to get the extent of s
extent-=origin;

int i=0;
#define RegisterAttr(x, type, count) {MPI_Get_address(&(p.x), offsets+i); offsets[i]-=origin; oldtypes[i]=type; blockcounts[i]=count; i++;}
RegisterAttr(HaloId, MPI_MEGA_INT, 1)
RegisterAttr(GlobalId, MPI_MEGA_INT, 1)
RegisterAttr(Nparticles, MPI_MEGA_INT, 1)
RegisterAttr(SplitFrom, MPI_MEGA_INT, 1)
RegisterAttr(ComovingAveragePosition[0], MPI_MEGA_REAL, 3)
RegisterAttr(PhysicalAverageVelocity[0], MPI_MEGA_REAL, 3)
RegisterAttr(KineticEnergy, MPI_FLOAT, 1)
RegisterAttr(GravitationalEnergy, MPI_FLOAT, 1)
RegisterAttr(TotalEnergy, MPI_FLOAT, 1)
RegisterAttr(RmsRadius, MPI_FLOAT, 1)
RegisterAttr(RmsVelocityRadius, MPI_FLOAT, 1)
RegisterAttr(VelDisp3D, MPI_FLOAT, 1)
RegisterAttr(VelDisp1D[0], MPI_FLOAT, 3)
RegisterAttr(Vmax, MPI_FLOAT, 1)
RegisterAttr(HalfMassRadius, MPI_FLOAT, 1)
RegisterAttr(HalfMassVelocityRadius, MPI_FLOAT, 1)
RegisterAttr(Real, MPI_INT, 1)
#undef RegisterAttr

MPI_Type_create_struct(i,blockcounts,offsets,oldtypes, &MPI_MEGAHalo_t);//some padding is added automatically by MPI as well
MPI_Type_create_resized(MPI_MEGAHalo_t,(MPI_Aint)0, extent, &MPI_MEGAHalo_t);
MPI_Type_commit(&MPI_MEGAHalo_t);
#undef NumAttr
}

void Halo_t::AverageCoordinates()
{
  AveragePosition(ComovingAveragePosition, Particles.data(), Particles.size());
  AverageVelocity(PhysicalAverageVelocity, Particles.data(), Particles.size());
}

double Halo_t::PotentialSum(MEGAReal softening, MEGAInt max_sample_size) const
/*sum of 1/sqrt(r^2+soft^2) over distinct pairs, from an evenly strided subsample for large halos*/
{
  MEGAInt np=Particles.size();
  if(np<2) return 0.;
  MEGAInt nsample=np;
  if(max_sample_size>1&&np>max_sample_size) nsample=max_sample_size;
  double stride=(double)np/nsample;
  vector <MEGAInt> sample(nsample);
  for(MEGAInt i=0;i<nsample;i++)
	sample[i]=floor(i*stride);

  double soft2=softening*softening, sum=0.;
  #pragma omp parallel for reduction(+:sum) schedule(dynamic,16) if(nsample>500)
  for(MEGAInt i=0;i<nsample;i++)
  {
	auto &x=Particles[sample[i]].ComovingPosition;
	for(MEGAInt j=i+1;j<nsample;j++)
	{
	  auto &y=Particles[sample[j]].ComovingPosition;
	  double r2=0.;
	  for(int k=0;k<3;k++)
	  {
		double d=x[k]-y[k];
		if(MEGAConfig.PeriodicBoundaryOn) d=NEAREST(d);
		r2+=d*d;
	  }
	  sum+=1./sqrt(r2+soft2);
	}
  }
  if(nsample<np)//scale up to the number of pairs in the full halo
	sum*=((double)np*(np-1))/((double)nsample*(nsample-1));
  return sum;
}

inline float HalfMassRadiusFromSorted(const vector <double> &r)
{
  if(r.empty()) return 0.;
  MEGAInt ihalf=(r.size()+1)/2-1;
  return r[ihalf];
}

void Halo_t::ComputeProperties(const Cosmology_t &cosmology, MEGAInt max_sample_size)
{
  Nparticles=Particles.size();
  AverageCoordinates();
  if(Nparticles==0) return;

  double pmass=cosmology.ParticleMassInSolarMass();
  double redshift=cosmology.Redshift;

  vector <double> r(Nparticles), vr(Nparticles);
  double sv[3]={0.,0.,0.}, sv2[3]={0.,0.,0.}, sr2=0.;
  for(MEGAInt i=0;i<Nparticles;i++)
  {
	MEGAxyz dv;
	RelativeVelocity(cosmology, Particles[i].ComovingPosition, Particles[i].PhysicalVelocity, ComovingAveragePosition, PhysicalAverageVelocity, dv);
	double dr2=0.;
	for(int k=0;k<3;k++)
	{
	  double dx=Particles[i].ComovingPosition[k]-ComovingAveragePosition[k];
	  if(MEGAConfig.PeriodicBoundaryOn) dx=NEAREST(dx);
	  dr2+=dx*dx;
	  sv[k]+=dv[k];
	  sv2[k]+=dv[k]*dv[k];
	}
	sr2+=dr2;
	r[i]=sqrt(dr2);
	vr[i]=sqrt(dv[0]*dv[0]+dv[1]*dv[1]+dv[2]*dv[2]);
  }

  double var3d=0.;
  for(int k=0;k<3;k++)
  {
	double mean=sv[k]/Nparticles;
	double var=sv2[k]/Nparticles-mean*mean;
	if(var<0) var=0.;
	VelDisp1D[k]=sqrt(var);
	var3d+=var;
  }
  VelDisp3D=sqrt(var3d);
  RmsRadius=sqrt(sr2/Nparticles);
  {
	double s=0.;
	for(auto &&v: vr) s+=v*v;
	RmsVelocityRadius=sqrt(s/Nparticles);
  }

  KineticEnergy=0.5*Nparticles*pmass*var3d/(1.+redshift);
  GravitationalEnergy=PhysicalConst::G*pmass*pmass*PotentialSum(cosmology.Softening, max_sample_size)*cosmology.HubbleParam*(1.+redshift)/PhysicalConst::MpcInKm;
  TotalEnergy=KineticEnergy-GravitationalEnergy;
  Real=(GravitationalEnergy>0&&KineticEnergy<=GravitationalEnergy);

  sort(r.begin(), r.end());
  sort(vr.begin(), vr.end());
  HalfMassRadius=HalfMassRadiusFromSorted(r);
  HalfMassVelocityRadius=HalfMassRadiusFromSorted(vr);

  double vmax2=0., km=cosmology.ComovingToPhysicalKm();
  for(MEGAInt i=0;i<Nparticles;i++)
  {
	if(r[i]<=0) continue;
	double v2=PhysicalConst::G*pmass*(i+1)/(r[i]*km);
	if(v2>vmax2) vmax2=v2;
  }
  Vmax=sqrt(vmax2);
}

class HaloParticleKeyList_t: public KeyList_t <MEGAInt, MEGAInt>
{
  typedef MEGAInt Index_t;
  typedef MEGAInt Key_t;
  vector <MEGAInt> ParticleIds;
  vector <MEGAInt> HaloIds;//local halo index
public:
  HaloParticleKeyList_t(HaloSnapshot_t &snap)
  {
	MEGAInt np=snap.CountParticles();
	ParticleIds.reserve(np);
	HaloIds.reserve(np);
	for(MEGAInt i=0;i<snap.size();i++)
	{
	  auto &Part=snap.Halos[i].Particles;
	  for(auto && p: Part)
	  {
		ParticleIds.push_back(p.Id);
		HaloIds.push_back(i);
	  }
	}
  };
  Index_t size() const
  {
	return ParticleIds.size();
  }
  Key_t GetKey(Index_t i) const
  {
	return ParticleIds[i];
  }
  Index_t GetIndex(Index_t i) const
  {
	return HaloIds[i];
  }
};

void HaloSnapshot_t::BuildMPIDataType()
{
  create_MPI_Halo_type(MPI_MEGA_Halo_t);
}
void HaloSnapshot_t::FillParticleHash()
{
  HaloParticleKeyList_t Ids(*this);
  ParticleHash.Fill(Ids, SpecialConst::NullHaloId);
}
void HaloSnapshot_t::Clear()
/* call this to reset the HaloSnapshot to empty.*/
{
  HaloList_t().swap(Halos);//this deeply cleans it
  ParticleHash.Clear();
  TotNumberOfHalos=0;
}
MEGAInt HaloSnapshot_t::CountParticles() const
{
  MEGAInt np=0;
  for(auto &&h: Halos)
	np+=h.Particles.size();
  return np;
}

void HaloSnapshot_t::GatherToRoot(MpiWorker_t &world, int root)
/*move every halo, with its particle ids, to root, sorted by HaloId*/
{
  vector <MEGAInt> LocalIds, AllIds;
  LocalIds.reserve(CountParticles());
  for(auto &&h: Halos)
  {
	h.Nparticles=h.Particles.size();
	for(auto &&p: h.Particles)
	  LocalIds.push_back(p.Id);
  }
  HaloList_t AllHalos;
  VectorGather(world, Halos, AllHalos, MPI_MEGA_Halo_t, root);
  VectorGather(world, LocalIds, AllIds, MPI_MEGA_INT, root);
  VectorFree(LocalIds);
  if(world.rank()==root)
  {
	MEGAInt offset=0;
	for(auto &&h: AllHalos)
	{
	  h.Particles.resize(h.Nparticles);
	  for(MEGAInt i=0;i<h.Nparticles;i++)
	  {
		h.Particles[i]=Particle_t(AllIds[offset+i], SpecialConst::NullCoordinate, SpecialConst::NullCoordinate);
	  }
	  offset+=h.Nparticles;
	}
	sort(AllHalos.begin(), AllHalos.end(), CompHaloId);
  }
  Halos.swap(AllHalos);
  ParticleHash.Clear();
}
