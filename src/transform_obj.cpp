// Facility Layout
// by Frank Gennari
// object transformation functions
// 10/18/26
#include "transform_obj.h"

#include <glm/glm.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <glm/gtc/matrix_transform.hpp>


// *** xform_matrix ***


float       *xform_matrix::get_ptr()       {glm::mat4       &m(*this); return glm::value_ptr(m);}
float const *xform_matrix::get_ptr() const {glm::mat4 const &m(*this); return glm::value_ptr(m);}

void xform_matrix::apply_to_point(point &p) const {
	glm::vec4 const v((*this) * glm::vec4(p.x, p.y, p.z, 1.0f));
	p.assign(v.x, v.y, v.z);
}
void xform_matrix::apply_translate(vector3d const &v) {
	glm::mat4 &m(*this);
	m = glm::translate(m, vec3_from_vector3d(v));
}
void xform_matrix::apply_rotate(float angle, vector3d const &axis) {
	if (angle == 0.0) return;
	glm::mat4 &m(*this);
	m = glm::rotate(m, angle, vec3_from_vector3d(axis.get_norm()));
}


glm::mat4 get_rotation_matrix(vector3d const &vrot, float angle) {
	return glm::rotate(glm::mat4(1.0f), angle, vec3_from_vector3d(vrot.get_norm()));
}


void rotate_vector3d(vector3d const &vin, vector3d const &vrot, float angle, vector3d &vout) {

	if (angle == 0.0) {vout = vin; return;}
	glm::vec4 const v(get_rotation_matrix(vrot, angle) * glm::vec4(vin.x, vin.y, vin.z, 0.0f));
	vout.assign(v.x, v.y, v.z);
}
