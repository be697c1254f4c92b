#ifndef CELL_GRID_H_INCLUDED
#define CELL_GRID_H_INCLUDED

#include "datatypes.h"
#include "kd_tree.h"

class CellGrid_t
/*bins the points into a regular mesh of about NumberOfCells cells, as a head-of-chain linked list.
 * only used to order the queries so that spatially close points are searched together.*/
{
private:
  int NDiv, NDiv2;
  MEGAReal Range[3][2];
  MEGAReal Step[3];
  int RoundGridId(int i) const
  {//to correct for rounding error near boundary
	return i<0?0:(i>=NDiv?NDiv-1:i);
  }
  MEGAInt Sub2Ind(int i, int j, int k) const
  {
	return i+j*NDiv+k*NDiv2;
  }
public:
  vector <MEGAInt> HOC;
  vector <MEGAInt> List;
  CellGrid_t(): NDiv(0), NDiv2(0), HOC(), List()
  {
  }
  void Build(MEGAInt ncells, const PositionData_t &data);
  int GetNDiv() const
  {
	return NDiv;
  }
  MEGAInt GetCellId(const MEGAxyz &x) const;
  /*all point indices, cell by cell*/
  void GetQueryOrder(vector <MEGAInt> &order) const;
};

#endif
