/**
 * @file bond_breaking_test.cpp
 * @brief Tests for in-place bond breaking
 *
 * Tests:
 * 1. Five-particle layout, exact rows after breaking (stale slots included)
 * 2. Repeated calls with unchanged coordinates change nothing
 * 3. Progressive stretching: monotone counts, surviving bonds within horizon,
 *    emergent symmetry
 * 4. Row content matches a sequential swap-with-last reference
 * 5. Damage and bond totals
 * 6. Precondition violations
 * 7. Pre-crack: bonds crossing a segment are removed before loading
 */

#include <peribond/core/core.hpp>
#include <peribond/peridynamics/peridynamics.hpp>

#include <cmath>
#include <iostream>
#include <random>
#include <vector>

using namespace prb;
using namespace prb::pd;

static int tests_passed = 0;
static int tests_failed = 0;

#define CHECK(cond, msg) do { \
    if (cond) { \
        std::cout << "[PASS] " << msg << "\n"; \
        tests_passed++; \
    } else { \
        std::cout << "[FAIL] " << msg << "\n"; \
        tests_failed++; \
    } \
} while(0)

// ============================================================================
// Helpers
// ============================================================================

/**
 * @brief Copy of @p x0 with every particle moved by a random offset in [-amp, amp]
 */
PDCoordView jitter(const PDCoordView& x0, Real amplitude, std::mt19937& gen) {
    std::uniform_real_distribution<Real> dist(-amplitude, amplitude);

    PDCoordView x("x", x0.extent(0), x0.extent(1));
    auto x_host = Kokkos::create_mirror_view(x);
    Kokkos::deep_copy(x_host, x0);
    for (Index i = 0; i < x_host.extent(0); ++i)
        for (Index d = 0; d < x_host.extent(1); ++d)
            x_host(i, d) += dist(gen);
    Kokkos::deep_copy(x, x_host);
    return x;
}

/**
 * @brief Uniform stretch along the first axis by factor (1 + strain)
 */
PDCoordView stretch(const PDCoordView& x0, Real strain) {
    PDCoordView x("x", x0.extent(0), x0.extent(1));
    auto x_host = Kokkos::create_mirror_view(x);
    Kokkos::deep_copy(x_host, x0);
    for (Index i = 0; i < x_host.extent(0); ++i)
        x_host(i, 0) *= (1.0 + strain);
    Kokkos::deep_copy(x, x_host);
    return x;
}

/**
 * @brief Sequential swap-with-last removal on host copies
 */
void reference_break(PDBondListHostView& rows, PDCountHostView& counts,
                     const PDCoordHostView& x, Real horizon) {
    for (Index i = 0; i < rows.extent(0); ++i) {
        Index k = 0;
        while (k < counts(i)) {
            Index j = rows(i, k);
            Real r2 = 0.0;
            for (Index d = 0; d < x.extent(1); ++d) {
                Real dx = x(j, d) - x(i, d);
                r2 += dx * dx;
            }
            if (std::sqrt(r2) >= horizon) {
                rows(i, k) = rows(i, counts(i) - 1);
                counts(i) -= 1;
            } else {
                ++k;
            }
        }
    }
}

bool same_state(const BondList& a, const PDBondListHostView& rows, const PDCountHostView& counts) {
    auto a_rows = a.bond_list_host();
    auto a_counts = a.valid_count_host();
    for (Index i = 0; i < rows.extent(0); ++i) {
        if (a_counts(i) != counts(i)) return false;
        for (Index k = 0; k < rows.extent(1); ++k) {
            if (a_rows(i, k) != rows(i, k)) return false;
        }
    }
    return true;
}

PDCoordView five_particles() {
    return make_coordinates({
        {0.0, 0.0, 0.0},
        {1.0, 0.0, 0.0},
        {0.0, 1.0, 0.0},
        {2.0, 0.0, 0.0},
        {0.0, 0.0, 1.0}
    });
}

PDCoordView five_particles_moved() {
    return make_coordinates({
        {0.0, 0.0, 0.0},
        {2.0, 0.0, 0.0},
        {0.0, 1.0, 0.0},
        {3.0, 0.0, 0.0},
        {0.0, 0.0, 2.0}
    });
}

// ============================================================================
// Test 1: five particles
// ============================================================================

void test_five_particle_break() {
    std::cout << "\n=== Test 1: Five-Particle Bond Breaking ===" << std::endl;

    const Real horizon = 1.1;
    BondList bonds;
    bonds.build(five_particles(), horizon, 3);

    Index broken = bonds.break_bonds(five_particles_moved(), horizon);

    std::vector<std::vector<Index>> expected_rows = {
        {2, 2, 4}, {3, 3, 0}, {0, 0, 0}, {1, 0, 0}, {0, 0, 0}
    };
    std::vector<Index> expected_counts = {1, 1, 1, 1, 0};

    auto rows = bonds.bond_list_host();
    auto counts = bonds.valid_count_host();
    bool rows_ok = true;
    bool counts_ok = true;
    for (Index i = 0; i < expected_rows.size(); ++i) {
        if (counts(i) != expected_counts[i]) counts_ok = false;
        for (Index k = 0; k < 3; ++k) {
            if (rows(i, k) != expected_rows[i][k]) rows_ok = false;
        }
    }

    CHECK(rows_ok, "Rows are [2,2,4] [3,3,0] [0,0,0] [1,0,0] [0,0,0]");
    CHECK(counts_ok, "Counts are [1,1,1,1,0]");
    CHECK(broken == 4, "Four bonds broken");
    CHECK(bonds.neighbors(4).empty(), "Particle 4 is isolated");
}

// ============================================================================
// Test 2: idempotence
// ============================================================================

void test_idempotent() {
    std::cout << "\n=== Test 2: Idempotence ===" << std::endl;

    const Real horizon = 1.1;
    BondList bonds;
    bonds.build(five_particles(), horizon, 3);

    auto moved = five_particles_moved();
    bonds.break_bonds(moved, horizon);
    auto rows = bonds.bond_list_host();
    auto counts = bonds.valid_count_host();

    Index broken_again = bonds.break_bonds(moved, horizon);
    CHECK(broken_again == 0, "Second call breaks nothing");
    CHECK(same_state(bonds, rows, counts), "Second call leaves rows and counts unchanged");

    BondList fresh;
    auto x0 = five_particles();
    fresh.build(x0, horizon, 3);
    auto rows0 = fresh.bond_list_host();
    auto counts0 = fresh.valid_count_host();
    CHECK(fresh.break_bonds(x0, horizon) == 0 && same_state(fresh, rows0, counts0),
          "Breaking with the reference coordinates changes nothing");
}

// ============================================================================
// Test 3: progressive stretching
// ============================================================================

void test_progressive_stretch() {
    std::cout << "\n=== Test 3: Progressive Stretching ===" << std::endl;

    const Real dx = 1.0;
    const Real horizon = 2.05 * dx;
    auto x0 = make_lattice(8, 6, 4, dx, 3);

    BondList bonds;
    bonds.build(x0, horizon, required_capacity(family(x0, horizon)));

    std::mt19937 gen(1234);
    auto previous = bonds.valid_count_host();

    bool monotone = true;
    bool within = true;
    bool symmetric = true;
    bool no_self = true;
    Index total_broken = 0;

    for (int step = 1; step <= 12; ++step) {
        auto x = jitter(stretch(x0, 0.01 * step), 0.05 * step, gen);
        total_broken += bonds.break_bonds(x, horizon);

        auto x_host = Kokkos::create_mirror_view(x);
        Kokkos::deep_copy(x_host, x);
        auto rows = bonds.bond_list_host();
        auto counts = bonds.valid_count_host();
        const Index n = counts.extent(0);

        std::vector<std::vector<bool>> adjacency(n, std::vector<bool>(n, false));
        for (Index i = 0; i < n; ++i) {
            if (counts(i) > previous(i)) monotone = false;
            for (Index k = 0; k < counts(i); ++k) {
                Index j = rows(i, k);
                if (j == i) no_self = false;
                if (!(euclid(x_host, i, j) < horizon)) within = false;
                adjacency[i][j] = true;
            }
        }
        for (Index i = 0; i < n; ++i)
            for (Index j = 0; j < n; ++j)
                if (adjacency[i][j] != adjacency[j][i]) symmetric = false;

        previous = counts;
    }

    CHECK(total_broken > 0, "Stretching breaks bonds");
    CHECK(total_broken == bonds.broken_bonds(), "Per-call totals add up to broken_bonds()");
    CHECK(monotone, "Valid counts never increase");
    CHECK(within, "Every surviving bond is shorter than the horizon");
    CHECK(no_self, "No self bonds appear");
    CHECK(symmetric, "Bond relation stays symmetric");
}

// ============================================================================
// Test 4: reference comparison
// ============================================================================

void test_matches_sequential_reference() {
    std::cout << "\n=== Test 4: Sequential Reference ===" << std::endl;

    const Real dx = 0.1;
    const Real horizon = 3.015 * dx;
    auto x0 = make_lattice(10, 10, 1, dx, 2);

    BondList bonds;
    bonds.build(x0, horizon, required_capacity(family(x0, horizon), 4));

    auto rows = bonds.bond_list_host();
    auto counts = bonds.valid_count_host();

    std::mt19937 gen(99);
    bool identical = true;
    for (int step = 1; step <= 5; ++step) {
        auto x = jitter(x0, 0.04 * step, gen);
        auto x_host = Kokkos::create_mirror_view(x);
        Kokkos::deep_copy(x_host, x);

        bonds.break_bonds(x, horizon);
        reference_break(rows, counts, x_host, horizon);

        if (!same_state(bonds, rows, counts)) identical = false;
    }
    CHECK(identical, "Rows and stale slots match sequential swap-with-last removal");
}

// ============================================================================
// Test 5: damage
// ============================================================================

void test_damage() {
    std::cout << "\n=== Test 5: Damage ===" << std::endl;

    const Real horizon = 1.1;
    BondList bonds;
    bonds.build(five_particles(), horizon, 3);

    auto initial_damage = to_host_vector(bonds.damage());
    bool all_zero = true;
    for (Real d : initial_damage) {
        if (d != 0.0) all_zero = false;
    }
    CHECK(all_zero, "Damage is zero after construction");
    CHECK(bonds.total_bonds() == 8 && bonds.broken_bonds() == 0, "8 intact bonds, none broken");

    bonds.break_bonds(five_particles_moved(), horizon);
    auto damage = to_host_vector(bonds.damage());

    const Real tol = 1.0e-12;
    CHECK(std::abs(damage[0] - 2.0 / 3.0) < tol, "Particle 0 lost two of three bonds");
    CHECK(std::abs(damage[1] - 0.5) < tol, "Particle 1 lost one of two bonds");
    CHECK(damage[2] == 0.0 && damage[3] == 0.0, "Particles 2 and 3 are intact");
    CHECK(damage[4] == 1.0, "Particle 4 is fully damaged");
    CHECK(bonds.total_bonds() == 4 && bonds.broken_bonds() == 4, "4 intact, 4 broken");

    auto lone = make_coordinates({{0.0, 0.0}, {5.0, 5.0}});
    BondList isolated;
    isolated.build(lone, 1.0, 1);
    auto lone_damage = to_host_vector(isolated.damage());
    CHECK(lone_damage[0] == 0.0 && lone_damage[1] == 0.0,
          "Particles without initial bonds report zero damage");
}

// ============================================================================
// Test 6: preconditions
// ============================================================================

void test_preconditions() {
    std::cout << "\n=== Test 6: Preconditions ===" << std::endl;

    BondList bonds;
    bool threw = false;
    try {
        bonds.break_bonds(five_particles(), 1.1);
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    CHECK(threw, "Breaking an unbuilt list is rejected");

    bonds.build(five_particles(), 1.1, 3);

    threw = false;
    try {
        bonds.break_bonds(make_lattice(2, 2, 1, 1.0, 3), 1.1);
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    CHECK(threw, "Coordinate set with a different particle count is rejected");

    threw = false;
    try {
        bonds.break_bonds(make_coordinates({{0.0, 0.0}, {1.0, 0.0}, {0.0, 1.0},
                                            {2.0, 0.0}, {0.0, 0.0}}), 1.1);
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    CHECK(threw, "Coordinate set with a different dimension is rejected");
    CHECK(bonds.total_bonds() == 8, "Rejected calls leave the list untouched");
}

// ============================================================================
// Test 7: pre-crack
// ============================================================================

void test_pre_crack() {
    std::cout << "\n=== Test 7: Pre-Crack ===" << std::endl;

    // 4x2 unit lattice, particle (i, j) has index i + 4 j
    auto x = make_lattice(4, 2, 1, 1.0, 2);
    const Real horizon = 1.5;
    const Index capacity = required_capacity(family(x, horizon));

    BondList bonds;
    bonds.build(x, horizon, capacity);
    const Index before = bonds.total_bonds();
    CHECK(bonds.neighbors(1) == std::vector<Index>({0, 2, 4, 5, 6}), "Row 1 before the crack");

    // Through crack between columns 1 and 2 cuts 1-2, 5-6, 1-6 and 5-2
    CrackSegment through;
    through.start = {1.5, -1.0};
    through.end = {1.5, 2.0};
    Index cut = apply_crack(bonds, x, through);

    CHECK(cut == 8, "Four bonds cut, two row entries each");
    CHECK(bonds.total_bonds() == before - 8, "Intact total drops by the cut entries");
    CHECK(bonds.neighbors(1) == std::vector<Index>({0, 4, 5}), "Row 1 keeps its left side");
    CHECK(bonds.neighbors(2) == std::vector<Index>({3, 6, 7}), "Row 2 keeps its right side");
    CHECK(bonds.neighbors(0) == std::vector<Index>({1, 4, 5}), "Row 0 is untouched");

    auto rows = bonds.bond_list_host();
    bool zero_tail = true;
    for (Index k = 3; k < capacity; ++k) {
        if (rows(1, k) != 0) zero_tail = false;
    }
    CHECK(zero_tail, "Excluded slots are zeroed");

    auto damage = to_host_vector(bonds.damage());
    bool undamaged = true;
    for (Real d : damage) {
        if (d != 0.0) undamaged = false;
    }
    CHECK(undamaged && bonds.broken_bonds() == 0, "Pre-cracked bonds do not count as damage");

    // Short crack below y = 0.25 only cuts 1-2
    BondList partial;
    partial.build(x, horizon, capacity);
    CrackSegment edge;
    edge.start = {1.5, -1.0};
    edge.end = {1.5, 0.25};
    CHECK(apply_crack(partial, x, edge) == 2, "Edge crack cuts a single bond");
    CHECK(partial.neighbors(1) == std::vector<Index>({0, 4, 5, 6}), "Bond 1-2 removed, 1-6 kept");

    io::ConfigReader reader;
    auto config = reader.read_string("crack:\n  start: [1.5, -1]\n  end: [1.5, 2]\n");
    auto parsed = CrackSegment::from_config(config.subsection("crack"));
    CHECK(parsed.start[0] == 1.5 && parsed.start[1] == -1.0 &&
          parsed.end[0] == 1.5 && parsed.end[1] == 2.0, "Crack read from configuration");

    BondList stretched;
    stretched.build(five_particles(), 1.1, 3);
    stretched.break_bonds(five_particles_moved(), 1.1);
    bool threw = false;
    try {
        apply_crack(stretched, five_particles(), through);
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    CHECK(threw, "Pre-crack after bonds broke is rejected");
}

int main() {
    InitOptions options;
    options.log_level = Logger::Level::Warn;
    Context context(options);

    std::cout << "========================================" << std::endl;
    std::cout << "PeriBond Bond Breaking Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        test_five_particle_break();
        test_idempotent();
        test_progressive_stretch();
        test_matches_sequential_reference();
        test_damage();
        test_preconditions();
        test_pre_crack();
    } catch (const Exception& e) {
        std::cout << "[FAIL] Unexpected exception: " << e.what() << "\n";
        tests_failed++;
    }

    std::cout << "\n========================================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;
    std::cout << "========================================" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
