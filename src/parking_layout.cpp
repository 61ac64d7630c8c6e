// Facility Layout - Angled Parking Bays: Dividers and Vehicles
// by Frank Gennari
// 10/18/26

#include "layout.h"


void check_parking_class(parking_class_t const &pc, float structure_length) {

	std::ostringstream oss;

	if (!(pc.width > 0.0) || !(pc.length > 0.0) || !(pc.line_width > 0.0)) {
		oss << "parking bay dimensions must be positive (width=" << pc.width << ", length=" << pc.length << ", line_width=" << pc.line_width << ")";
	}
	else if (!(pc.angle_deg > 0.0 && pc.angle_deg < 90.0)) { // sin/cos degenerate at 0 and 90
		oss << "parking angle must be strictly between 0 and 90 degrees (angle=" << pc.angle_deg << ")";
	}
	else if (!(pc.fill_prob >= 0.0 && pc.fill_prob <= 1.0)) {
		oss << "parking fill probability must be in [0,1] (fill=" << pc.fill_prob << ")";
	}
	else if (pc.rows != 1 && pc.rows != 2) {
		oss << "parking rows must be 1 or 2 (rows=" << pc.rows << ")";
	}
	else if (pc.rows == 1 && pc.single_side != 1 && pc.single_side != -1) {
		oss << "parking single_side must be 1 or -1 (single_side=" << pc.single_side << ")";
	}
	else if (pc.num_variants < 1 || pc.occ_anchor >= NUM_OCC_ANCHORS) {
		oss << "invalid parking vehicle model setup (variants=" << pc.num_variants << ", anchor=" << pc.occ_anchor << ")";
	}
	else if (!(pc.get_available_length(structure_length) > 0.0)) {
		oss << "parking available length must be positive (structure length=" << structure_length << ", length_reduction=" << pc.length_reduction << ")";
	}
	else {
		int const bay_count(get_bay_count(pc, structure_length));
		if (bay_count >= 2 && bay_count <= int(MAX_REPEAT_COUNT)) return; // valid
		oss << "parking needs between 2 and " << MAX_REPEAT_COUNT << " bays (bay_count=" << bay_count << ", bay_pitch=" << pc.get_bay_pitch() << ")";
	}
	throw config_error_t(oss.str());
}

int get_bay_count(parking_class_t const &pc, float structure_length) {
	double const num(floor(double(pc.get_available_length(structure_length))/double(pc.get_bay_pitch())));
	if (!(num <= MAX_REPEAT_COUNT + pc.margin_bays)) return int(MAX_REPEAT_COUNT + 1); // too many, or NaN
	return int(max(num, -1.0)) - int(pc.margin_bays);
}


// returns the center of the divider line, which runs from the aisle pivot out along the bay angle
point get_divider_center(parking_class_t const &pc, parking_bay_t const &bay) {
	float const a(pc.get_angle_rad()), hlen(0.5*pc.length);
	return point((pc.get_aisle_x(bay.side) - bay.side*sin(a)*hlen), pc.marking_height, (bay.aisle_z + cos(a)*hlen));
}

point get_vehicle_pos(parking_class_t const &pc, parking_bay_t const &bay) {
	float const a(pc.get_angle_rad());
	point pos(get_divider_center(pc, bay));

	if (pc.occ_anchor == OCC_ANCHOR_AISLE) { // shift along the aisle to the middle of the bay
		pos.z += 0.5*pc.get_bay_pitch();
	}
	else { // shift perpendicular to the divider to the middle of the bay
		float const hwidth(0.5*pc.width);
		pos.x -= bay.side*cos(a)*hwidth;
		pos.z += bay.side*sin(a)*hwidth;
	}
	return pos;
}

void plan_parking_class(parking_class_t const &pc, float structure_length, rand_source_t const &rand_src, vect_placed_inst_t &insts, uint8_t tag) {

	check_parking_class(pc, structure_length); // throws before anything is added
	if (!rand_src) {throw config_error_t("parking planner requires a random source");}
	unsigned const bay_count(get_bay_count(pc, structure_length)), num_sides(pc.get_num_sides());
	float const a(pc.get_angle_rad()), bay_pitch(pc.get_bay_pitch()), start_z(pc.get_start_z(structure_length));
	float const last_end(start_z + bay_count*bay_pitch);

	if (last_end > 0.5*structure_length) {
		std::ostringstream oss;
		oss << park_class_names[min(unsigned(tag), unsigned(NUM_PARK_CLASSES-1))] << " parking bays extend " << (last_end - 0.5*structure_length) << "m past the structure end";
		log_warning(oss.str());
	}
	vector3d const line_sz(pc.line_width, pc.marking_height, pc.length);
	insts.reserve(insts.size() + 2*bay_count*num_sides);

	for (unsigned i = 0; i < bay_count; ++i) {
		for (unsigned s = 0; s < num_sides; ++s) {
			parking_bay_t bay;
			bay.index    = i;
			bay.aisle_z  = start_z + i*bay_pitch;
			bay.side     = pc.get_side_sign(s);
			bay.occupied = (rand_src() > (1.0 - pc.fill_prob)); // independent per side
			if (bay.occupied && pc.num_variants > 1) {bay.variant = min(unsigned(rand_src()*pc.num_variants), pc.num_variants-1);}
			float const rot(bay.side*a);
			insts.emplace_back(INST_PARK_DIVIDER, get_divider_center(pc, bay), line_sz, plus_y, rot, tag);
			if (!bay.occupied) continue;
			insts.emplace_back(INST_VEHICLE, get_vehicle_pos(pc, bay), pc.model_size, plus_y, (rot + PI), tag); // face the aisle
			insts.back().variant = bay.variant;
		} // for s
	} // for i
}

void plan_parking(parking_params_t const &pp, float structure_length, rand_source_t const &rand_src, vect_placed_inst_t &insts) {
	for (unsigned c = 0; c < NUM_PARK_CLASSES; ++c) {
		if (pp.classes[c].enabled) {check_parking_class(pp.classes[c], structure_length);} // check all classes before any output
	}
	for (unsigned c = 0; c < NUM_PARK_CLASSES; ++c) {
		if (pp.classes[c].enabled) {plan_parking_class(pp.classes[c], structure_length, rand_src, insts, c);}
	}
}
