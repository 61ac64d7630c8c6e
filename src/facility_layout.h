// Facility Layout - Core Geometry Types
// by Frank Gennari
// 10/18/26

#ifndef _FACILITY_LAYOUT_H_
#define _FACILITY_LAYOUT_H_

#include <stdio.h>
#include <stdlib.h>
#include <math.h>

 // STL include
#include <vector>
#include <algorithm>
#include <map>
#include <assert.h>
#include <iostream>
#include <string>
#include <sstream>
using std::vector;
using std::map;
using std::swap;
using std::pair;
using std::make_pair;
using std::string;
using std::cout;
using std::cerr;
using std::endl;
using std::min;
using std::max;

#ifndef PI
#define PI 3.141592654
#endif

float    const TOLERANCE        = 1.0E-12;
unsigned const MAX_CHARS        = 256;

float const PI_TWO          = PI/2.0;
float const TO_DEG          = 180.0/PI;
float const TO_RADIANS      = PI/180.0;

#define UNROLL_2X(expr) {{unsigned const i_(0); expr} {unsigned const i_(1); expr}}
#define UNROLL_3X(expr) {UNROLL_2X(expr) {unsigned const i_(2); expr}}


template<typename T> struct pointT { // size = 12 (float), 24(double)

	T x, y, z;

	pointT() {}
	pointT(T x_, T y_, T z_) : x(x_), y(y_), z(z_) {}
	template<typename S> pointT(S const &p) : x(p.x), y(p.y), z(p.z) {}

	bool operator==(const pointT &p) const {return (p.x == x && p.y == y && p.z == z);}
	bool operator!=(const pointT &p) const {return !operator==(p);}

	const T &operator[](unsigned i) const {
		switch(i) {
			case 0: return x;
			case 1: return y;
			case 2: return z;
			default: assert(0);
		}
		return x; // never gets here
	}
	T &operator[](unsigned i) {
		switch(i) {
			case 0: return x;
			case 1: return y;
			case 2: return z;
			default: assert(0);
		}
		return x; // never gets here
	}
	void assign(T x_, T y_, T z_)    {x = x_; y = y_; z = z_;}
	void operator+=(pointT const &p) {x += p.x; y += p.y; z += p.z;}
	void operator-=(pointT const &p) {x -= p.x; y -= p.y; z -= p.z;}
	void operator*=(double m)        {x *= m; y *= m; z *= m;}

	pointT get_norm() const {
		T const vmag(mag());
		return ((vmag < TOLERANCE) ? *this : pointT(x/vmag, y/vmag, z/vmag));
	}
	pointT operator+(pointT const &p)  const {return pointT((x+p.x), (y+p.y), (z+p.z));}
	pointT operator-(pointT const &p)  const {return pointT((x-p.x), (y-p.y), (z-p.z));}
	pointT operator*(T      const val) const {return pointT(x*val, y*val, z*val);}
	pointT operator-()                 const {return pointT(-x, -y, -z);}
	T mag_sq()    const {return (x*x + y*y + z*z);}
	T mag()       const {return sqrt(mag_sq());}
};

// premultiply a pointT by a scalar
template<typename S, typename T> pointT<T> inline operator*(S const v, pointT<T> const &p) {return pointT<T>(v*p.x, v*p.y, v*p.z);}

template<typename T> std::ostream &operator<<(std::ostream &out, pointT<T> const &p) {
	return out << p.x << " " << p.y << " " << p.z;
}


typedef pointT<float>  point;
typedef pointT<float>  vector3d;


// constants
point    const all_zeros(0, 0, 0);
vector3d const plus_y(0, 1, 0); // up
vector3d const plus_z(0, 0, 1); // along the building length
vector3d const zero_vector(0, 0, 0);


struct cube_t { // size = 24

	float d[3][2]; // {x,y,z},{min,max}

	cube_t() {}

	cube_t(float x1, float x2, float y1, float y2, float z1, float z2) {
		d[0][0] = x1; d[0][1] = x2;
		d[1][0] = y1; d[1][1] = y2;
		d[2][0] = z1; d[2][1] = z2;
	}
	cube_t(point const &p1, point const &p2) {
		UNROLL_3X(d[i_][0] = min(p1[i_], p2[i_]); d[i_][1] = max(p1[i_], p2[i_]);)
	}
	bool operator==(cube_t const &c) const {
		UNROLL_3X(if (d[i_][0] != c.d[i_][0]) return 0;)
		UNROLL_3X(if (d[i_][1] != c.d[i_][1]) return 0;)
		return 1;
	}
	void union_with_pt(point const &pt) {
		UNROLL_3X(d[i_][0] = min(d[i_][0], pt[i_]); d[i_][1] = max(d[i_][1], pt[i_]);)
	}
	bool contains_pt(point const &pt) const {
		UNROLL_3X(if (pt[i_] < d[i_][0] || pt[i_] > d[i_][1]) return 0;)
		return 1;
	}
	bool contains_pt_xz(point const &pt) const { // strict; ground plane only
		return (pt.x > d[0][0] && pt.x < d[0][1] && pt.z > d[2][0] && pt.z < d[2][1]);
	}
	float get_sz_dim(unsigned dim) const {return (d[dim][1] - d[dim][0]);}
	float dx() const {return get_sz_dim(0);}
	float dy() const {return get_sz_dim(1);}
	float dz() const {return get_sz_dim(2);}
	point get_llc() const {return point(d[0][0], d[1][0], d[2][0]);}
	point get_urc() const {return point(d[0][1], d[1][1], d[2][1]);}
};

cube_t const all_zeros_cube(0,0,0,0,0,0);

// ground plane rectangle: x1 x2 z1 z2; y is unbounded
inline cube_t ground_rect(float x1, float x2, float z1, float z2) {return cube_t(x1, x2, -1.0E6, 1.0E6, z1, z2);}

#endif // _FACILITY_LAYOUT_H_
