#ifndef EDGEWFC_ARRAY2D_HPP
#define EDGEWFC_ARRAY2D_HPP

#include <vector>
#include <loguru.hpp>

// Row-major grid, indexed (x, y) = (column, row).
template<typename T>
struct Array2D
{
public:
	Array2D() : _width(0), _height(0) {}
	Array2D(size_t w, size_t h, T value = {})
		: _width(w), _height(h), _data(w * h, value) {}
	Array2D(size_t w, size_t h, std::vector<T> data)
		: _width(w), _height(h), _data(std::move(data))
	{
		CHECK_EQ_F(_data.size(), w * h);
	}

	size_t index(size_t x, size_t y) const
	{
		DCHECK_LT_F(x, _width);
		DCHECK_LT_F(y, _height);
		return y * _width + x;
	}

	inline       T& mut_ref(size_t x, size_t y)       { return _data[index(x, y)]; }
	inline const T&     ref(size_t x, size_t y) const { return _data[index(x, y)]; }
	inline       T      get(size_t x, size_t y) const { return _data[index(x, y)]; }
	inline void set(size_t x, size_t y, const T& value) { _data[index(x, y)] = value; }

	size_t   width()  const { return _width;       }
	size_t   height() const { return _height;      }
	size_t   size()   const { return _data.size(); }
	const T* data()   const { return _data.data(); }

	bool operator==(const Array2D& o) const
	{
		return _width == o._width && _height == o._height && _data == o._data;
	}
	bool operator!=(const Array2D& o) const { return !(*this == o); }

private:
	size_t _width, _height;
	std::vector<T> _data;
};

#endif
