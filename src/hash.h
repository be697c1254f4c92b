/*hash table data for Id2Index*/
#ifndef HASH_HEADER_INCLUDED
#define HASH_HEADER_INCLUDED

#include <vector>
#include "datatypes.h"

template <class Key_t, class Index_t>
class KeyList_t
{
public:
  virtual Key_t GetKey(const Index_t i) const=0;
  virtual Index_t GetIndex(const Index_t i) const=0;
  virtual Index_t size() const=0;
  virtual ~KeyList_t()
  {}
};

template <class Key_t, class Index_t>
struct IndexedKey_t
{
  Key_t Key;
  Index_t Index;
};

template <class Key_t, class Index_t>
class MappedIndexTable_t
/*sorted (key, index) pairs, looked up by binary search*/
{
public:
  typedef IndexedKey_t<Key_t, Index_t> Pair_t;
  Index_t NullIndex;
private:
  vector <Pair_t> Map;
public:
  MappedIndexTable_t(): NullIndex(SpecialConst::NullParticleId), Map()
  {
  }
  void Fill(const KeyList_t <Key_t, Index_t> &Keys, Index_t null_index=SpecialConst::NullParticleId);
  void Clear();
  Index_t GetIndex(const Key_t key) const;
  size_t size() const
  {
	return Map.size();
  }
  /*first duplicated key, or false if all keys are unique*/
  bool FindDuplicate(Key_t &key) const;
};

/*list of plain keys, indexed by their position*/
template <class Key_t, class Index_t>
class VectorKeyList_t: public KeyList_t <Key_t, Index_t>
{
  const vector <Key_t> &Keys;
public:
  VectorKeyList_t(const vector <Key_t> &keys): Keys(keys)
  {
  }
  Key_t GetKey(const Index_t i) const
  {
	return Keys[i];
  }
  Index_t GetIndex(const Index_t i) const
  {
	return i;
  }
  Index_t size() const
  {
	return Keys.size();
  }
};

#include "hash.tpp"

#endif
