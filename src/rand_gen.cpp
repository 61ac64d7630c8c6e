// Facility Layout - Random Number Generators
// by Frank Gennari
// 10/18/26

#include "rand_gen.h"
#include <memory>


rand_source_t make_seeded_rand_source(long seed) {
	std::shared_ptr<rand_gen_t> rgen(new rand_gen_t);
	rgen->set_state(seed, 12345);
	rgen->rand_mix();
	return [rgen]() {return rgen->rand_float();};
}
