#pragma once

#include <cstddef> // size_t
#include <string>

template<typename T>
struct span {
	T* ptr;
	size_t len;

	span() = default;

	template<size_t N>
	span(T (&tab)[N]) : ptr(tab), len(N) {
	}

	span(T* ptr_, size_t len_) : ptr(ptr_), len(len_) {
	}

	void operator+=(size_t n) {
		ptr += n;
		len -= n;
	}

	T& operator [] (int i) const {
		return ptr[i];
	}

	T* begin() const {
		return ptr;
	}

	T* end() const {
		return ptr + len;
	}
};

inline span<const char> toSpan(std::string const& s) {
	return span<const char>(s.data(), s.size());
}
