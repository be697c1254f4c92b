using namespace std;
#include <iostream>
#include <sstream>
#include <string>
#include <cstdlib>
#include <cstdio>

#include "snapshot.h"
#include "mymath.h"

void Particle_t::create_MPI_type(MPI_Datatype &dtype)
{
/*to create the struct data type for communication*/
Particle_t &p=*this;
#define NumAttr 5
MPI_Datatype oldtypes[NumAttr];
int blockcounts[NumAttr];
MPI_Aint   offsets[NumAttr], origin,extent;

MPI_Get_address(&p,&origin);
MPI_Get_address((&p)+1,&extent);//to get the extent of s
extent-=origin;

int i=0;
#define RegisterAttr(x, type, count) {MPI_Get_address(&(p.x), offsets+i); offsets[i]-=origin; oldtypes[i]=type; blockcounts[i]=count; i++;}
RegisterAttr(Id, MPI_MEGA_INT, 1)
RegisterAttr(ComovingPosition[0], MPI_MEGA_REAL, 3)
RegisterAttr(PhysicalVelocity[0], MPI_MEGA_REAL, 3)
RegisterAttr(OwnerRank, MPI_INT, 1)
RegisterAttr(HaloTag, MPI_MEGA_INT, 1)
#undef RegisterAttr

MPI_Type_create_struct(i,blockcounts,offsets,oldtypes, &dtype);//some padding is added automatically by MPI as well
MPI_Type_create_resized(dtype,(MPI_Aint)0, extent, &dtype);
MPI_Type_commit(&dtype);
#undef NumAttr
}

void ParticleSnapshot_t::Clear()
/*reset to empty*/
{
  vector<Particle_t>().swap(Particles);
}

MEGAInt ParticleSnapshot_t::CountOwned(int thisrank) const
{
  MEGAInt n=0;
  for(auto &&p: Particles)
	if(p.OwnerRank==thisrank) n++;
  return n;
}

void AveragePosition(MEGAxyz& CoM, const Particle_t Particles[], const MEGAInt NumPart)
/*average position; the first particle is used as the origin in a periodic box*/
{
	MEGAInt i,j;
	double sx[3],origin[3];

	if(0==NumPart) return;
	if(1==NumPart)
	{
	  copyMEGAxyz(CoM, Particles[0].ComovingPosition);
	  return;
	}

	sx[0]=sx[1]=sx[2]=0.;
	if(MEGAConfig.PeriodicBoundaryOn)
	  for(j=0;j<3;j++)
		origin[j]=Particles[0].ComovingPosition[j];

	for(i=0;i<NumPart;i++)
	  for(j=0;j<3;j++)
	  if(MEGAConfig.PeriodicBoundaryOn)
		  sx[j]+=NEAREST(Particles[i].ComovingPosition[j]-origin[j]);
	  else
		  sx[j]+=Particles[i].ComovingPosition[j];

	for(j=0;j<3;j++)
	{
		sx[j]/=NumPart;
		if(MEGAConfig.PeriodicBoundaryOn)
		{
		  sx[j]+=origin[j];
		  sx[j]=position_modulus(sx[j], MEGAConfig.BoxSize);
		}
		CoM[j]=sx[j];
	}
}
void AverageVelocity(MEGAxyz& CoV, const Particle_t Particles[], const MEGAInt NumPart)
{
	MEGAInt i,j;
	double sv[3];

	if(0==NumPart) return;

	sv[0]=sv[1]=sv[2]=0.;
	for(i=0;i<NumPart;i++)
	  for(j=0;j<3;j++)
		sv[j]+=Particles[i].PhysicalVelocity[j];

	for(j=0;j<3;j++)
	  CoV[j]=sv[j]/NumPart;
}
