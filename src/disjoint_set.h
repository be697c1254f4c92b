#ifndef DISJOINT_SET_H_INCLUDED
#define DISJOINT_SET_H_INCLUDED

#include <vector>
#include "datatypes.h"

class DisjointSet_t
/*union-find over 0..n-1. the root of a merged set is always its smallest element.*/
{
  vector <MEGAInt> Parent;
public:
  DisjointSet_t(MEGAInt n=0)
  {
	Reset(n);
  }
  void Reset(MEGAInt n)
  {
	Parent.resize(n);
	for(MEGAInt i=0;i<n;i++)
	  Parent[i]=i;
  }
  MEGAInt size() const
  {
	return Parent.size();
  }
  MEGAInt Find(MEGAInt i)
  {
	while(Parent[i]!=i)
	{
	  Parent[i]=Parent[Parent[i]];//path halving
	  i=Parent[i];
	}
	return i;
  }
  /*returns true if a and b were in different sets*/
  bool Union(MEGAInt a, MEGAInt b)
  {
	a=Find(a);
	b=Find(b);
	if(a==b) return false;
	if(a<b)
	  Parent[b]=a;
	else
	  Parent[a]=b;
	return true;
  }
  /*relabel the sets as 0..nsets-1 in order of first appearance; returns nsets*/
  MEGAInt CompactLabels(vector <MEGAInt> &labels)
  {
	MEGAInt n=Parent.size();
	labels.assign(n, -1);
	vector <MEGAInt> rootlabel(n, -1);
	MEGAInt nsets=0;
	for(MEGAInt i=0;i<n;i++)
	{
	  MEGAInt r=Find(i);
	  if(rootlabel[r]<0) rootlabel[r]=nsets++;
	  labels[i]=rootlabel[r];
	}
	return nsets;
  }
};

#endif
