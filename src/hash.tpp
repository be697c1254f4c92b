#include <algorithm>
#include <cstdlib>
#include <omp.h>

//=====general Id2Index table======//
/* the hash-table implementation here is by sorting the keys and using binsearch to locate them*/

template <class Key_t, class Index_t>
inline bool CompPair(const IndexedKey_t<Key_t, Index_t> & a, const IndexedKey_t<Key_t, Index_t> & b)
{
  return (a.Key<b.Key);
};
template <class Key_t, class Index_t>
void MappedIndexTable_t<Key_t, Index_t>::Fill(const KeyList_t <Key_t, Index_t> &Keys, Index_t null_index)
{
  NullIndex=null_index;
  Index_t n=Keys.size();
  Map.resize(n);
  #pragma omp parallel for
  for(Index_t i=0;i<n;i++)
  {
    Map[i].Key=Keys.GetKey(i);
    Map[i].Index=Keys.GetIndex(i);
  }
  sort(Map.begin(), Map.end(), CompPair<Key_t, Index_t>);
}
template <class Key_t, class Index_t>
void MappedIndexTable_t<Key_t, Index_t>::Clear()
{
  vector <Pair_t>().swap(Map);
}
template <class Key_t, class Index_t>
inline int CompKeyWithPair(const void *a, const void *b)
{
  Key_t va=* static_cast<const Key_t *>(a);
  Key_t vb=static_cast<const IndexedKey_t<Key_t, Index_t> *> (b)->Key;
  if(va>vb) return 1;
  if(va<vb) return -1;
  return 0;
};
template <class Key_t, class Index_t>
Index_t MappedIndexTable_t<Key_t, Index_t>::GetIndex(const Key_t key) const
{
  if(Map.empty()) return NullIndex;
  const Pair_t *p=(const Pair_t *) bsearch(&key,Map.data(),Map.size(),sizeof(Pair_t),CompKeyWithPair<Key_t, Index_t>);
  if(NULL==p) return NullIndex;  //no match
  return p->Index;
}
template <class Key_t, class Index_t>
bool MappedIndexTable_t<Key_t, Index_t>::FindDuplicate(Key_t &key) const
{
  for(size_t i=1;i<Map.size();i++)
	if(Map[i].Key==Map[i-1].Key)
	{
	  key=Map[i].Key;
	  return true;
	}
  return false;
}
