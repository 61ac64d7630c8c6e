// Facility Layout - Frame Geometry and Structure Self-Test
// by Frank Gennari
// 10/18/26

#include "test_util.h"


int test_frame_geom() {
	int error(0);
	structure_params_t sp; // 96 x 12, spacing 6, eaves 5, ridge 5.9
	frame_geom_t const fg(compute_frame_geom(sp));
	error += check(approx_eq(fg.half_span, 6.0), "half span");
	error += check(approx_eq(fg.rise, 0.9), "rise");
	error += check(approx_eq(fg.pitch, atan(0.9/6.0), 1.0E-6), "pitch matches atan(rise/half_span)");
	error += check(approx_eq(fg.pitch, 0.1489), "pitch ~0.1489 rad");
	error += check(approx_eq(fg.slope_len, sqrt(0.81 + 36.0)), "slope length");
	error += check(approx_eq(fg.rafter_len, fg.slope_len + 0.5), "rafter length includes overhang");
	error += check(approx_eq(fg.get_slope_mid_y(), 5.45), "slope mid height");
	error += check((fg.get_slope_pitch(1) > 0.0 && fg.get_slope_pitch(-1) < 0.0), "left slope +pitch, right slope -pitch");
	error += check((fg.get_slope_center_x(1) == -3.0 && fg.get_slope_center_x(-1) == 3.0), "slope anchors at -/+ half_span/2");
	return error;
}

int test_frame_geom_errors() {
	int error(0);
	structure_params_t flat;
	flat.ridge_height = flat.eaves_height;
	error += check_throws([&]() {compute_frame_geom(flat);}, "ridge == eaves");
	structure_params_t inverted;
	inverted.ridge_height = 4.0;
	error += check_throws([&]() {compute_frame_geom(inverted);}, "ridge below eaves");
	structure_params_t narrow;
	narrow.width = 0.0;
	error += check_throws([&]() {compute_frame_geom(narrow);}, "zero width");
	narrow.width = -2.0;
	error += check_throws([&]() {compute_frame_geom(narrow);}, "negative width");
	return error;
}

int test_structure() {
	int error(0);
	structure_params_t sp;
	frame_geom_t const fg(compute_frame_geom(sp));
	unsigned const col_count(get_column_count(sp));
	error += check((col_count == 17), "column count = ceil(96/6) + 1");
	vect_placed_inst_t insts;
	build_structure(sp, fg, insts);
	error += check((insts.size() == 4*col_count + 2), "instance count");
	error += check((count_kind(insts, INST_COLUMN) == 2*col_count), "column pairs");
	error += check((count_kind(insts, INST_RAFTER) == 2*col_count), "rafter pairs");
	error += check((count_kind(insts, INST_ROOF_SLOPE) == 2), "roof slopes emitted once per side");
	vector<point> left, right;

	for (auto i = insts.begin(); i != insts.end(); ++i) {
		if (i->kind == INST_COLUMN) {
			(i->pos.x < 0.0 ? left : right).push_back(i->pos);
			error += check((i->size.y == sp.eaves_height && i->pos.y == 0.5f*sp.eaves_height), "column spans ground to eaves");
		}
		else if (i->kind == INST_RAFTER) {
			bool const is_left(i->pos.x < 0.0);
			error += check(approx_eq(i->pos.x, (is_left ? -3.0 : 3.0)), "rafter anchor x");
			error += check(approx_eq(i->pos.y, fg.get_slope_mid_y()), "rafter anchor y");
			error += check((i->rot_axis == plus_z && approx_eq(i->rot_angle, (is_left ? fg.pitch : -fg.pitch))), "rafter rotation");
		}
		else if (i->kind == INST_ROOF_SLOPE) {
			error += check((i->pos.z == 0.0 && approx_eq(i->size.z, 97.0)), "roof slope spans the length plus overhang");
			error += check(approx_eq(i->pos.y, fg.get_slope_mid_y() + 0.15), "roof slope lifted above the rafters");
		}
	}
	error += check((left.size() == col_count && right.size() == col_count), "left and right column counts");

	for (unsigned i = 0; i < min(left.size(), right.size()); ++i) {
		error += check((left[i].x == -6.0 && right[i].x == 6.0), "columns at -/+ width/2");
		error += check((left[i].z == right[i].z), "column pairs share z");
		error += check(approx_eq(left[i].z, i*6.0 - 48.0), "column z spacing");
	}
	return error;
}

int test_structure_overhang() { // last column line is not clamped to the structure end
	int error(0);
	structure_params_t sp;
	sp.length = 10.0;
	vect_placed_inst_t insts;
	build_structure(sp, compute_frame_geom(sp), insts);
	error += check((get_column_count(sp) == 3), "column count = ceil(10/6) + 1");
	float max_z(-1.0E6);

	for (auto i = insts.begin(); i != insts.end(); ++i) {
		if (i->kind == INST_COLUMN) {max_z = max(max_z, i->pos.z);}
	}
	error += check(approx_eq(max_z, 7.0), "last column overhangs +length/2");

	structure_params_t degenerate;
	degenerate.length = 0.0;
	vect_placed_inst_t insts2;
	error += check_throws([&]() {build_structure(degenerate, compute_frame_geom(degenerate), insts2);}, "degenerate structure");
	error += check(insts2.empty(), "no output on error");

	structure_params_t huge;
	huge.length = 1.0E30;
	error += check((get_column_count(huge) == MAX_REPEAT_COUNT + 1), "huge column count clamped");
	error += check_throws([&]() {build_structure(huge, compute_frame_geom(huge), insts2);}, "too many column lines");
	error += check(insts2.empty(), "no output for too many column lines");
	return error;
}

int test_rafter_xform() { // rafters rise toward the ridge on both sides
	int error(0);
	structure_params_t sp;
	frame_geom_t const fg(compute_frame_geom(sp));
	vect_placed_inst_t insts;
	build_structure(sp, fg, insts);
	float const hlen(0.5*fg.rafter_len);

	for (auto i = insts.begin(); i != insts.end(); ++i) {
		if (i->kind != INST_RAFTER) continue;
		xform_matrix const m(i->get_xform());
		point lo(-hlen, 0.0, 0.0), hi(hlen, 0.0, 0.0);
		m.apply_to_point(lo);
		m.apply_to_point(hi);
		point const &inner((i->pos.x < 0.0) ? hi : lo), &outer((i->pos.x < 0.0) ? lo : hi); // ends nearest and farthest from the ridge
		error += check((inner.y > outer.y), "rafter rises toward the ridge");
		error += check((fabs(inner.x) < fabs(outer.x)), "inner rafter end nearest the ridge");
		error += check(approx_eq(inner.y - outer.y, 2.0*hlen*sin(fg.pitch)), "rafter rise matches the pitch");
	}
	return error;
}

int main() {
	int error(0);
	error += test_frame_geom();
	error += test_frame_geom_errors();
	error += test_structure();
	error += test_structure_overhang();
	error += test_rafter_xform();
	return finish_test(error, "test_frame_structure");
}
