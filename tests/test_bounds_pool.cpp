#include <catch2/catch.hpp>

#include "natlib/core/bounds.hpp"
#include "natlib/core/pool.hpp"
#include "natlib/core/errors.hpp"

#include <type_traits>

using namespace natlib::core;

TEST_CASE("Bounds", "[bounds]") {
	Bounds b = {{-1.0, 1.0}, {0.0, 10.0}};

	REQUIRE(b.size() == 2);
	REQUIRE(b.width(1) == 10.0);
	REQUIRE(b.clamp(0, 3.0) == 1.0);
	REQUIRE(b.clamp(1, -3.0) == 0.0);
	REQUIRE(b.contains({0.0, 10.0}));
	REQUIRE_FALSE(b.contains({0.0, 10.5}));
	REQUIRE_FALSE(b.contains({0.0}));

	std::vector<double> x = {5.0, 5.0};
	b.clamp(x);
	REQUIRE(x == std::vector<double>{1.0, 5.0});

	REQUIRE_NOTHROW(b.validate());
	REQUIRE_THROWS_AS(Bounds().validate(), ConfigurationError);
	const Bounds inverted{{2.0, 1.0}};
	REQUIRE_THROWS_AS(inverted.validate(), ConfigurationError);
	REQUIRE_THROWS_AS(Bounds::fromVectors({0.0, 0.0}, {1.0}), ConfigurationError);
	REQUIRE(Bounds::uniform(3, -2.0, 2.0).ub(2) == 2.0);

	// a vector of ranges becomes Bounds only on request
	STATIC_REQUIRE(std::is_constructible_v<Bounds, std::vector<Bounds::TBound>>);
	STATIC_REQUIRE_FALSE(std::is_convertible_v<std::vector<Bounds::TBound>, Bounds>);
}

TEST_CASE("Random stream is reproducible", "[random]") {
	Rng a(123), b(123);
	for (int i = 0; i < 100; i++) REQUIRE(a.randomico(-5.0, 5.0) == b.randomico(-5.0, 5.0));

	Rng r(9);
	for (int i = 0; i < 100; i++) {
		const double v = r.randomico(2.0, 3.0);
		REQUIRE(v >= 2.0);
		REQUIRE(v < 3.0);
		const int k = r.irandomico(1, 2);
		REQUIRE((k == 1 || k == 2));
	}
	REQUIRE(r.randomico(4.0, 4.0) == 4.0);

	const auto d = r.distinct(4, 6, {2});
	REQUIRE(d.size() == 4);
	for (std::size_t i = 0; i < d.size(); i++) {
		REQUIRE(d[i] != 2);
		REQUIRE(d[i] < 6);
		for (std::size_t j = i + 1; j < d.size(); j++) REQUIRE(d[i] != d[j]);
	}
}

TEST_CASE("Initial pool generators", "[pool]") {
	const Bounds b = Bounds::uniform(3, 0.0, 1.0);
	Rng rng(1);

	const auto uniform = CreatePoolSolutions(b, 50, UniformPool(), rng);
	REQUIRE(uniform.size() == 50);
	for (const auto &x : uniform) REQUIRE(b.contains(x));

	// values drawn outside the box are clipped
	const auto gaussian = CreatePoolSolutions(b, 50, GaussianPool({0.5, 0.5, 0.5}, {10.0, 10.0, 10.0}), rng);
	for (const auto &x : gaussian) REQUIRE(b.contains(x));
	REQUIRE_THROWS_AS(GaussianPool({0.0}, {1.0, 1.0}), ConfigurationError);

	const auto filtered = CreatePoolSolutionsBy(b, 20, [](const std::vector<double> &x) { return x[0] < 0.5; }, rng, 20000);
	REQUIRE(filtered.size() == 20);
	for (const auto &x : filtered) REQUIRE(x[0] < 0.5);

	REQUIRE_THROWS_AS(CreatePoolSolutionsBy(b, 5, [](const std::vector<double> &) { return false; }, rng, 100),
	                  ConfigurationError);
}
