#include <catch2/catch.hpp>

#include "natlib/core/best.hpp"
#include "natlib/core/ranking.hpp"

using namespace natlib::core;

static TIndividual ind(double x, std::vector<double> f) { return TIndividual({x}, TFitness(std::move(f))); }

TEST_CASE("Single-objective archive keeps the first best", "[archive]") {
	BestArchive archive;
	REQUIRE(archive.empty());
	REQUIRE_THROWS_AS(archive.best(), std::out_of_range);

	REQUIRE(archive.update(ind(1.0, {5.0})));
	REQUIRE_FALSE(archive.update(ind(2.0, {5.0})));   // tie: incumbent stays
	REQUIRE_FALSE(archive.update(ind(3.0, {6.0})));
	REQUIRE(archive.best().x[0] == 1.0);

	REQUIRE(archive.update(ind(4.0, {1.0})));
	REQUIRE(archive.size() == 1);
	REQUIRE(archive.best().x[0] == 4.0);
	REQUIRE_FALSE(archive.isMulti());
}

TEST_CASE("Invalid individuals never enter the archive", "[archive]") {
	BestArchive archive;
	const double NaN = std::numeric_limits<double>::quiet_NaN();

	REQUIRE_FALSE(archive.update(ind(0.0, {NaN})));
	REQUIRE_FALSE(archive.update(ind(0.0, {})));
	REQUIRE(archive.empty());
}

TEST_CASE("Pareto archive", "[archive]") {
	BestArchive archive(3);

	REQUIRE(archive.update(ind(0.0, {2.0, 2.0})));
	REQUIRE(archive.update(ind(1.0, {1.0, 3.0})));
	REQUIRE(archive.isMulti());
	REQUIRE(archive.size() == 2);

	// dominated points are rejected, equal values are kept
	REQUIRE_FALSE(archive.update(ind(2.0, {3.0, 3.0})));
	REQUIRE(archive.update(ind(3.0, {2.0, 2.0})));
	REQUIRE(archive.size() == 3);

	// a dominating point evicts everything it dominates
	REQUIRE(archive.update(ind(4.0, {1.5, 1.5})));
	REQUIRE(archive.size() == 2);
	for (const auto &m : archive.front()) {
		REQUIRE(m.x[0] != 0.0);
		REQUIRE(m.x[0] != 3.0);
	}

	// the limit is enforced by crowding, extremes survive
	REQUIRE(archive.update(ind(5.0, {0.0, 5.0})));
	REQUIRE(archive.update(ind(6.0, {5.0, 0.0})));
	REQUIRE(archive.size() == 3);

	const auto &front = archive.front();
	auto has = [&](double x) { return std::ranges::any_of(front, [x](const TIndividual &m) { return m.x[0] == x; }); };
	REQUIRE(has(5.0));
	REQUIRE(has(6.0));

	// members are mutually non-dominated
	for (const auto &a : front)
		for (const auto &b : front)
			REQUIRE_FALSE(Dominates(a.f, b.f));

	Rng rng(7);
	for (int i = 0; i < 10; i++) {
		const auto &leader = archive.sample(rng);
		REQUIRE(std::ranges::any_of(front, [&](const TIndividual &m) { return &m == &leader; }));
	}
}

TEST_CASE("Pareto archive keeps distinct points with equal values", "[archive]") {
	BestArchive archive(20);

	REQUIRE(archive.update(ind(0.0, {1.0, 1.0})));
	REQUIRE(archive.update(ind(9.0, {1.0, 1.0})));
	REQUIRE(archive.size() == 2);
	REQUIRE(archive.front()[0].x[0] == 0.0);
	REQUIRE(archive.front()[1].x[0] == 9.0);
}

TEST_CASE("Pareto archive reports a point evicted by the limit", "[archive]") {
	BestArchive archive(3);

	REQUIRE(archive.update(ind(0.0, {0.0, 4.0})));
	REQUIRE(archive.update(ind(1.0, {2.0, 2.0})));
	REQUIRE(archive.update(ind(2.0, {4.0, 0.0})));

	// non-dominated, but more crowded than {2, 2}
	REQUIRE_FALSE(archive.update(ind(7.0, {2.1, 1.9})));
	REQUIRE(archive.size() == 3);
	for (const auto &m : archive.front()) REQUIRE(m.x[0] != 7.0);

	// an extreme point survives and evicts the most crowded member
	REQUIRE(archive.update(ind(8.0, {-1.0, 6.0})));
	REQUIRE(archive.size() == 3);
}
