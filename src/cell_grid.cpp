#include <cmath>
#include <algorithm>

#include "cell_grid.h"

void CellGrid_t::Build(MEGAInt ncells, const PositionData_t &data)
{
  MEGAInt np=data.size();
  NDiv=floor(pow((double)max(ncells, (MEGAInt)1), 1./3.)+1e-6);
  if(NDiv<1) NDiv=1;
  NDiv2=NDiv*NDiv;

  for(int j=0;j<3;j++)
  {
	Range[j][0]=0.;
	Range[j][1]=0.;
  }
  if(np)
  {
	for(int j=0;j<3;j++)
	  Range[j][0]=Range[j][1]=data[0][j];
	for(MEGAInt i=1;i<np;i++)
	  for(int j=0;j<3;j++)
	  {
		if(data[i][j]<Range[j][0]) Range[j][0]=data[i][j];
		if(data[i][j]>Range[j][1]) Range[j][1]=data[i][j];
	  }
  }
  for(int j=0;j<3;j++)
  {
	Step[j]=(Range[j][1]-Range[j][0])/NDiv;
	if(Step[j]<=0) Step[j]=1.;//degenerate extent; everything falls in the first cell
  }

  HOC.assign((MEGAInt)NDiv2*NDiv, -1);
  List.assign(np, -1);
  for(MEGAInt i=np-1;i>=0;i--)//fill backwards so that each chain is in ascending order
  {
	MEGAInt icell=GetCellId(data[i]);
	List[i]=HOC[icell];
	HOC[icell]=i;
  }
}

MEGAInt CellGrid_t::GetCellId(const MEGAxyz &x) const
{
  int sub[3];
  for(int j=0;j<3;j++)
	sub[j]=RoundGridId(floor((x[j]-Range[j][0])/Step[j]));
  return Sub2Ind(sub[0], sub[1], sub[2]);
}

void CellGrid_t::GetQueryOrder(vector <MEGAInt> &order) const
{
  order.clear();
  order.reserve(List.size());
  for(MEGAInt icell=0;icell<(MEGAInt)HOC.size();icell++)
	for(MEGAInt pid=HOC[icell];pid>=0;pid=List[pid])
	  order.push_back(pid);
}
