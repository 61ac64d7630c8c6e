// Facility Layout
// by Frank Gennari
// object transformation class definitions
// 10/18/26
#pragma once

#include "facility_layout.h"

#define GLM_FORCE_RADIANS
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>


inline glm::vec3 vec3_from_vector3d (vector3d const &v) {return glm::vec3(v.x, v.y, v.z);}

glm::mat4 get_rotation_matrix(vector3d const &vrot, float angle);


struct xform_matrix : public glm::mat4 {

	xform_matrix() : glm::mat4(1.0) {} // identity
	xform_matrix(glm::mat4 const &m) : glm::mat4(m) {}
	float *get_ptr();
	float const *get_ptr() const;
	void apply_to_point(point &p) const;
	void apply_translate(vector3d const &v);
	void apply_rotate(float angle, vector3d const &axis); // angle in radians
};


// rotate vin by angle (radians, right-handed) about vrot to get vout
void rotate_vector3d(vector3d const &vin, vector3d const &vrot, float angle, vector3d &vout);
inline vector3d rotate_vector3d(vector3d const &vin, vector3d const &vrot, float angle) {
	vector3d vout(vin);
	rotate_vector3d(vin, vrot, angle, vout);
	return vout;
}
