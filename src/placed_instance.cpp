// Facility Layout - Placed Instances
// by Frank Gennari
// 10/18/26

#include "layout.h"


string const inst_kind_names[NUM_INST_KINDS] =
{"column", "rafter", "roofSlope", "solarPanel", "parkingDivider", "vehicle", "gutter", "container", "fencePost", "fencePanel", "tree"};
string const park_class_names[NUM_PARK_CLASSES] = {"car", "coach"};


xform_matrix placed_instance_t::get_xform() const {
	xform_matrix m;
	m.apply_translate(pos);
	m.apply_rotate(rot_angle, rot_axis);
	return m;
}


void layout_stats_t::add(placed_instance_t const &inst) {
	assert(inst.kind < NUM_INST_KINDS);
	if (num_insts == 0) {bcube = cube_t(inst.pos, inst.pos);} else {bcube.union_with_pt(inst.pos);}
	++num_insts;
	++counts[inst.kind];

	if (inst.tag < NUM_PARK_CLASSES) {
		if (inst.kind == INST_PARK_DIVIDER) {++bays    [inst.tag];}
		if (inst.kind == INST_VEHICLE     ) {++vehicles[inst.tag];}
	}
}

void layout_stats_t::print(std::ostream &out) const {
	out << "Layout: " << num_insts << " instances" << endl;

	for (unsigned i = 0; i < NUM_INST_KINDS; ++i) {
		if (counts[i] > 0) {out << "  " << inst_kind_names[i] << ": " << counts[i] << endl;}
	}
	for (unsigned i = 0; i < NUM_PARK_CLASSES; ++i) {
		if (bays[i] == 0) continue;
		out << "  " << park_class_names[i] << " bays occupied: " << vehicles[i] << " / " << bays[i] << endl;
	}
	out << "  bounds: (" << bcube.get_llc() << ") - (" << bcube.get_urc() << ")" << endl;
}
