// Facility Layout - Random Number Generators
// by Frank Gennari
// 10/18/26
#pragma once

#include <functional>
#include <utility>


class rgen_core_t {
protected:
	// this is a good random number generator written by Stephen E. Derenzo
	template<typename T> inline void randome_int(T &ranptr) {
		if ((rseed1 = 40014*(rseed1%53668) - 12211*(rseed1/53668)) < 0) rseed1 += 2147483563;
		if ((rseed2 = 40692*(rseed2%52774) - 3791 *(rseed2/52774)) < 0) rseed2 += 2147483399;
		if ((ranptr = (T)rseed1 - (T)rseed2) < 1) ranptr += 2147483562;
	}

public:
	long rseed1, rseed2;

	rgen_core_t() {set_state(1,1);}
	void set_state(long rs1, long rs2) {rseed1 = rs1; rseed2 = rs2;}
};


template<typename base> class rand_gen_template_t : public base {

public:
	using rgen_core_t::rseed1;
	using rgen_core_t::rseed2;

	int rand() {
		int rand_num;
		base::randome_int(rand_num);
		return rand_num;
	}
	void rand_mix() {rand(); std::swap(rseed1, rseed2);}
	float rand_float() {return 0.000001*(rand()%1000000);} // uniform 0 to 1
};

typedef rand_gen_template_t<rgen_core_t> rand_gen_t;


// the randomness boundary of the layout generators: returns a value in [0,1)
typedef std::function<float()> rand_source_t;

inline rand_source_t make_rand_source(rand_gen_t &rgen) {return [&rgen]() {return rgen.rand_float();};}

rand_source_t make_seeded_rand_source(long seed); // owns its own rand_gen_t
