#pragma once

#include <cstddef>
#include <vector>

namespace vhex {

//! Disjoint sets over the indices [0, size) with union by size and path halving.
class UnionFind {
public:
	UnionFind(std::size_t size);

	std::size_t find(std::size_t element);
	bool unite(std::size_t a, std::size_t b); //!< Returns false if both were already in one set.
	bool connected(std::size_t a, std::size_t b);

	std::size_t size() const;

private:
	std::vector<std::size_t> m_parent;
	std::vector<std::size_t> m_setSize; //!< Valid for set roots only.
};

} // namespace vhex
