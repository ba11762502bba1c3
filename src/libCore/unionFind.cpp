#include "vhex/core/unionFind.hpp"

#include <cassert>
#include <numeric>
#include <utility>

namespace vhex {

UnionFind::UnionFind(const std::size_t size) : m_parent(size), m_setSize(size, 1u) {
	std::iota(m_parent.begin(), m_parent.end(), std::size_t{0});
}

std::size_t UnionFind::find(std::size_t element) {
	assert(element < m_parent.size());

	while (m_parent[element] != element) {
		m_parent[element] = m_parent[m_parent[element]];
		element           = m_parent[element];
	}
	return element;
}

bool UnionFind::unite(const std::size_t a, const std::size_t b) {
	auto rootA = find(a);
	auto rootB = find(b);
	if (rootA == rootB) {
		return false;
	}

	if (m_setSize[rootA] < m_setSize[rootB]) {
		std::swap(rootA, rootB);
	}
	m_parent[rootB] = rootA;
	m_setSize[rootA] += m_setSize[rootB];
	return true;
}

bool UnionFind::connected(const std::size_t a, const std::size_t b) {
	return find(a) == find(b);
}

std::size_t UnionFind::size() const {
	return m_parent.size();
}

} // namespace vhex
