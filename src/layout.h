// Facility Layout - Portal Frame, Solar Array, Parking and Site Layout
// by Frank Gennari
// 10/18/26
#pragma once

#include "facility_layout.h"
#include "rand_gen.h"
#include "transform_obj.h"
#include <stdint.h>
#include <stdexcept>


// thrown before any instance is produced; the config must be fixed by the caller
class config_error_t : public std::runtime_error {
public:
	explicit config_error_t(string const &msg) : std::runtime_error(msg) {}
};


enum {INST_COLUMN=0, INST_RAFTER, INST_ROOF_SLOPE, INST_SOLAR_PANEL, INST_PARK_DIVIDER, INST_VEHICLE,
	INST_GUTTER, INST_CONTAINER, INST_FENCE_POST, INST_FENCE_PANEL, INST_TREE, NUM_INST_KINDS};
enum {OCC_ANCHOR_AISLE=0, OCC_ANCHOR_SIDE, NUM_OCC_ANCHORS}; // vehicle anchoring within the bay
enum {PARK_CLASS_CAR=0, PARK_CLASS_COACH, NUM_PARK_CLASSES};

unsigned const MAX_REPEAT_COUNT = 100000; // column lines or parking bays per class

extern string const inst_kind_names[NUM_INST_KINDS];
extern string const park_class_names[NUM_PARK_CLASSES];


struct placed_instance_t { // size = 48
	point pos; // center of the local box; vehicles: footprint center at marking height; trees: ground footprint center
	vector3d size; // box dimensions in the local, unrotated frame
	vector3d rot_axis;
	float rot_angle; // radians, right-handed about rot_axis
	uint8_t kind, variant, tag; // tag = port index for structure/solar, parking class for parking

	placed_instance_t() : pos(all_zeros), size(zero_vector), rot_axis(plus_y), rot_angle(0.0), kind(INST_COLUMN), variant(0), tag(0) {}
	placed_instance_t(uint8_t kind_, point const &pos_, vector3d const &size_, vector3d const &axis=plus_y, float angle=0.0, uint8_t tag_=0) :
		pos(pos_), size(size_), rot_axis(axis), rot_angle(angle), kind(kind_), variant(0), tag(tag_) {}
	bool operator==(placed_instance_t const &i) const {
		return (kind == i.kind && variant == i.variant && tag == i.tag && pos == i.pos && size == i.size && rot_axis == i.rot_axis && rot_angle == i.rot_angle);
	}
	bool operator!=(placed_instance_t const &i) const {return !operator==(i);}
	string const &get_kind_name() const {assert(kind < NUM_INST_KINDS); return inst_kind_names[kind];}
	void translate(vector3d const &v) {pos += v;}
	xform_matrix get_xform() const; // translate * rotate
};
typedef vector<placed_instance_t> vect_placed_inst_t;


struct structure_params_t {
	float length=96.0, width=12.0, column_spacing=6.0, eaves_height=5.0, ridge_height=5.9;
	// fixed construction details
	float rafter_overhang=0.5, roof_overhang=1.0, roof_lift=0.15;
	float column_size=0.2, rafter_depth=0.3, rafter_thick=0.15, roof_thick=0.05;
};

struct solar_params_t {
	unsigned rows_per_slope=3, panels_per_row=83;
	float panel_width=1.134, panel_length=1.762; // width runs along the building, length runs up the slope
	float gap_along_slope=0.05, gap_along_length=0.03;
	float panel_standoff=0.2; // anchor height above the slope midpoint
	float overhang_fix=0.2; // right slope only: down-slope shift that keeps panels off the ridge line
	float panel_thick=0.04;
};

struct parking_class_t {
	bool enabled=1;
	unsigned rows=2; // 1 or 2 rows of bays facing the aisle
	unsigned margin_bays=0, num_variants=1, occ_anchor=OCC_ANCHOR_AISLE;
	int single_side=-1; // side used by a one-row class
	float width=2.4, length=4.8, angle_deg=45.0; // bay width, bay/divider length, angle from the aisle axis
	float center_x=0.0, aisle_offset=0.0; // pivot for side s is at center_x - s*aisle_offset
	float fill_prob=0.5, line_width=0.1, marking_height=0.02;
	float start_margin=0.0, length_reduction=0.0; // clearance from the structure ends
	vector3d model_size=vector3d(1.9, 1.5, 4.5);

	float get_angle_rad() const {return TO_RADIANS*angle_deg;}
	float get_bay_pitch() const {return width/sin(get_angle_rad());} // divider spacing along the aisle
	float get_available_length(float structure_length) const {return (structure_length - length_reduction);}
	float get_start_z(float structure_length) const {return (-0.5*structure_length + start_margin);}
	float get_aisle_x(int side) const {return (center_x - side*aisle_offset);}
	unsigned get_num_sides() const {return ((rows == 2) ? 2 : 1);}
	int get_side_sign(unsigned side_ix) const {return ((rows == 2) ? ((side_ix == 0) ? 1 : -1) : single_side);}
};

struct parking_params_t {
	parking_class_t classes[NUM_PARK_CLASSES];

	parking_params_t();
	parking_class_t const &car  () const {return classes[PARK_CLASS_CAR  ];}
	parking_class_t const &coach() const {return classes[PARK_CLASS_COACH];}
};

struct container_t {
	float x=0.0, z=0.0, width=8.0, height=5.0, length=0.0; // length 0 = structure length
	container_t() {}
	container_t(float x_, float z_, float w, float h, float l) : x(x_), z(z_), width(w), height(h), length(l) {}
};

struct fence_run_t {
	float x=0.0, z=0.0, length=0.0, height=3.0;
	bool rotated=0; // turned 90 degrees about +Y
	fence_run_t() {}
	fence_run_t(float x_, float z_, float l, float h, bool r) : x(x_), z(z_), length(l), height(h), rotated(r) {}
};

struct site_params_t {
	vector<float> port_offsets; // X translation of each portal structure
	bool add_gutters=1;
	float gutter_width=0.5, gutter_height=0.2;
	vector<container_t> containers;
	vector<fence_run_t> fences;
	float post_spacing=3.0, post_width=0.1, fence_thick=0.02;
	unsigned tree_attempts=80;
	float tree_scale_min=0.8, tree_scale_range=0.4;
	vector3d tree_size=vector3d(3.0, 4.0, 3.0); // unscaled model size
	cube_t tree_area; // ground rect
	vector<cube_t> tree_exclude; // ground rects

	site_params_t();
};

struct layout_config_t {
	structure_params_t structure;
	solar_params_t solar;
	parking_params_t parking;
	site_params_t site;
	unsigned seed=1;
	bool print_timing=0;

	void validate() const; // throws config_error_t
};


struct frame_geom_t {
	float half_span=0.0, rise=0.0, pitch=0.0, slope_len=0.0, rafter_len=0.0, eaves_height=0.0;

	float get_slope_mid_y() const {return (eaves_height + 0.5*rise);}
	float get_slope_pitch(int side) const {return side*pitch;} // side: +1 = left slope, -1 = right slope
	float get_slope_center_x(int side) const {return -0.5*side*half_span;}
};

struct parking_bay_t { // transient; consumed into a divider and an optional vehicle
	unsigned index=0, variant=0;
	float aisle_z=0.0;
	int side=1;
	bool occupied=0;
};

struct layout_stats_t {
	unsigned num_insts=0;
	unsigned counts[NUM_INST_KINDS] = {};
	unsigned bays[NUM_PARK_CLASSES] = {}, vehicles[NUM_PARK_CLASSES] = {};
	cube_t bcube=all_zeros_cube; // of instance positions

	void add(placed_instance_t const &inst);
	void print(std::ostream &out) const;
};


// function prototypes - layout_params.cpp
bool load_layout_config(string const &fn, layout_config_t &cfg);
// frame_geom.cpp
frame_geom_t compute_frame_geom(structure_params_t const &sp);
// portal_frame.cpp
unsigned get_column_count(structure_params_t const &sp);
void build_structure(structure_params_t const &sp, frame_geom_t const &fg, vect_placed_inst_t &insts);
// solar_array.cpp
unsigned get_num_panels(solar_params_t const &sp);
void get_panel_offsets(solar_params_t const &sp, unsigned row, unsigned col, float &x_off, float &z_off);
float get_row_extent(solar_params_t const &sp);
void place_solar_panels(solar_params_t const &sp, frame_geom_t const &fg, vect_placed_inst_t &insts);
// parking_layout.cpp
void check_parking_class(parking_class_t const &pc, float structure_length);
int get_bay_count(parking_class_t const &pc, float structure_length);
void plan_parking_class(parking_class_t const &pc, float structure_length, rand_source_t const &rand_src, vect_placed_inst_t &insts, uint8_t tag=0);
void plan_parking(parking_params_t const &pp, float structure_length, rand_source_t const &rand_src, vect_placed_inst_t &insts);
// site_objects.cpp
unsigned get_fence_post_count(fence_run_t const &fence, float post_spacing);
void place_site_objects(site_params_t const &sp, structure_params_t const &st, rand_source_t const &rand_src, vect_placed_inst_t &insts);
// layout_compiler.cpp
void compile_layout(layout_config_t const &cfg, rand_source_t const &rand_src, vect_placed_inst_t &insts);
layout_stats_t get_layout_stats(vect_placed_inst_t const &insts);
// logging.cpp
void log_warning(string const &str);
void set_log_filename(string const &fn);
