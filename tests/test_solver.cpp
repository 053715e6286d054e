#include <catch2/catch.hpp>

#include "natlib/core/solver.hpp"
#include "natlib/core/ranking.hpp"
#include "natlib/mh/rga.hpp"
#include "natlib/mh/de.hpp"
#include "natlib/mh/pso.hpp"
#include "natlib/problems/benchmarks.hpp"
#include "objectives.hpp"

#include <set>
#include <type_traits>

using namespace natlib;
using namespace natlib::core;

static const double NaN = std::numeric_limits<double>::quiet_NaN();

TEST_CASE("RGA converges on the 2-dimensional sphere", "[solver]") {
	auto sphere = std::make_shared<problems::Sphere>(2);
	const Report r = Solver::build(std::make_unique<mh::Rga>(), sphere, Bounds::uniform(2, -10.0, 10.0))
	                     .seed(0)
	                     .popNum(20)
	                     .task(task::MaxGen(50))
	                     .solve();

	REQUIRE(r.gen() == 50);
	REQUIRE(r.seed() == 0);
	REQUIRE(r.bestFitness().eval() < 1e-3);
	REQUIRE(r.bestParameters().size() == 2);
}

TEST_CASE("Runs with the same seed are identical", "[solver]") {
	auto run = [](bool parallel) {
		auto rastrigin = std::make_shared<problems::Rastrigin>(5);
		return Solver::build(std::make_unique<mh::De>(), rastrigin, Bounds::uniform(5, -5.12, 5.12))
		    .seed(2024)
		    .popNum(30)
		    .parallel(parallel)
		    .task(task::MaxGen(40))
		    .solve();
	};

	const Report a = run(false);
	const Report b = run(false);
	const Report c = run(true);

	REQUIRE(a.bestParameters() == b.bestParameters());
	REQUIRE(a.context().bestHistory() == b.context().bestHistory());

	// batch evaluation keeps the input order, the stream is never used inside it
	REQUIRE(a.bestParameters() == c.bestParameters());
	REQUIRE(a.context().bestHistory() == c.context().bestHistory());
}

TEST_CASE("Configuration errors are raised before any evaluation", "[solver]") {
	auto counting = std::make_shared<CountingSphere>(2);

	SECTION("bounds and objective disagree on the dimension") {
		REQUIRE_THROWS_AS(Solver::build(std::make_unique<mh::Rga>(), counting, Bounds::uniform(3, -1.0, 1.0)).solve(),
		                  ConfigurationError);
	}

	SECTION("population below the variant minimum") {
		mh::TDeSettings settings;
		settings.strategy = mh::DeStrategy::Rand2;
		auto de = std::make_unique<mh::De>(settings);
		REQUIRE(de->minPopulation() == 6);

		REQUIRE_THROWS_AS(Solver::build(std::move(de), counting, Bounds::uniform(2, -1.0, 1.0)).popNum(5).solve(),
		                  ConfigurationError);
		REQUIRE_THROWS_AS(Solver::build(std::make_unique<mh::Pso>(), counting, Bounds::uniform(2, -1.0, 1.0)).popNum(1).solve(),
		                  ConfigurationError);
	}

	SECTION("invalid bounds") {
		REQUIRE_THROWS_AS(Solver::build(std::make_unique<mh::Rga>(), counting, Bounds::fromVectors({0.0, 1.0}, {1.0, 0.0})).solve(),
		                  ConfigurationError);
	}

	SECTION("ready pool of the wrong size or dimension") {
		REQUIRE_THROWS_AS(Solver::build(std::make_unique<mh::Rga>(), counting, Bounds::uniform(2, -1.0, 1.0))
		                      .popNum(4)
		                      .initPoolReady({{0.0, 0.0}, {0.1, 0.1}})
		                      .solve(),
		                  ConfigurationError);
		REQUIRE_THROWS_AS(Solver::build(std::make_unique<mh::Rga>(), counting, Bounds::uniform(2, -1.0, 1.0))
		                      .initPoolReady({{0.0, 0.0}, {0.1}})
		                      .solve(),
		                  ConfigurationError);
	}

	SECTION("Pareto limit") {
		REQUIRE_THROWS_AS(Solver::build(std::make_unique<mh::Rga>(), counting, Bounds::uniform(2, -1.0, 1.0)).paretoLimit(0).solve(),
		                  ConfigurationError);
	}

	REQUIRE(counting->calls() == 0);
}

TEST_CASE("Initial pool options", "[solver]") {
	auto sphere = std::make_shared<problems::Sphere>(2);

	SECTION("ready points are clipped and used as generation 0") {
		std::vector<std::vector<double>> initial;
		SolverBuilder builder = Solver::build(std::make_unique<mh::De>(), sphere, Bounds::uniform(2, -1.0, 1.0));
		builder.initPoolReady({{5.0, 0.5}, {0.1, -3.0}, {0.2, 0.2}, {0.3, 0.3}, {0.4, 0.4}})
		    .task(task::MaxGen(1))
		    .callback([&](const Context &ctx) {
			    if (ctx.gen() == 0)
				    for (const auto &ind : ctx.population()) initial.push_back(ind.x);
		    });

		const Report r = builder.solve();
		REQUIRE(r.context().popNum() == 5);
		REQUIRE(initial.size() == 5);
		REQUIRE(initial[0] == std::vector<double>{1.0, 0.5});
		REQUIRE(initial[1] == std::vector<double>{0.1, -1.0});
	}

	SECTION("filtered pool") {
		bool allPositive = true;
		Solver::build(std::make_unique<mh::De>(), sphere, Bounds::uniform(2, -1.0, 1.0))
		    .popNum(10)
		    .initPoolBy([](const std::vector<double> &x) { return x[0] > 0.0; })
		    .task(task::MaxGen(0))
		    .callback([&](const Context &ctx) {
			    for (const auto &ind : ctx.population()) allPositive = allPositive && ind.x[0] > 0.0;
		    })
		    .solve();
		REQUIRE(allPositive);
	}

	SECTION("gaussian pool") {
		const Report r = Solver::build(std::make_unique<mh::De>(), sphere, Bounds::uniform(2, -1.0, 1.0))
		                     .popNum(10)
		                     .initPool(GaussianPool({0.5, 0.5}, {0.01, 0.01}))
		                     .task(task::MaxGen(0))
		                     .solve();
		for (const auto &ind : r.context().population()) {
			REQUIRE(ind.x[0] == Approx(0.5).margin(0.1));
			REQUIRE(ind.x[1] == Approx(0.5).margin(0.1));
		}
	}
}

TEST_CASE("Callbacks", "[solver]") {
	auto counting = std::make_shared<CountingSphere>(2);

	SECTION("one call per generation, generation 0 included") {
		std::vector<std::uint64_t> seen;
		Solver::build(std::make_unique<mh::De>(), counting, Bounds::uniform(2, -1.0, 1.0))
		    .popNum(8)
		    .task(task::MaxGen(6))
		    .callback([&](const Context &ctx) { seen.push_back(ctx.gen()); })
		    .solve();
		REQUIRE(seen == std::vector<std::uint64_t>{0, 1, 2, 3, 4, 5, 6});
	}

	SECTION("a failing callback keeps the partial report") {
		bool caught = false;
		try {
			Solver::build(std::make_unique<mh::De>(), counting, Bounds::uniform(2, -1.0, 1.0))
			    .popNum(8)
			    .task(task::MaxGen(100))
			    .callback([](const Context &ctx) {
				    if (ctx.gen() == 3) throw std::runtime_error("stop here");
			    })
			    .solve();
		} catch (const CallbackFailure &e) {
			caught = true;
			REQUIRE(std::string(e.what()).find("stop here") != std::string::npos);
			REQUIRE(e.partial().gen() == 3);
			REQUIRE(e.partial().evaluations() == 8 * 4);
			REQUIRE(e.partial().bestFitness().isValid());
		}
		REQUIRE(caught);
		STATIC_REQUIRE_FALSE(std::is_convertible_v<Context, Report>);
	}

	SECTION("a callback throwing a non-standard value is wrapped too") {
		bool caught = false;
		try {
			Solver::build(std::make_unique<mh::De>(), counting, Bounds::uniform(2, -1.0, 1.0))
			    .popNum(8)
			    .task(task::MaxGen(100))
			    .callback([](const Context &ctx) {
				    if (ctx.gen() == 2) throw 42;
			    })
			    .solve();
		} catch (const CallbackFailure &e) {
			caught = true;
			REQUIRE(std::string(e.what()).find("generation 2") != std::string::npos);
			REQUIRE(e.partial().gen() == 2);
			REQUIRE(e.partial().evaluations() == 8 * 3);
		}
		REQUIRE(caught);
	}
}

TEST_CASE("RGA mutation keeps producing new points after its horizon", "[solver]") {
	mh::TRgaSettings settings;
	settings.cross = 0.0;
	settings.mutate = 1.0;
	settings.horizon = 100.0;

	// without crossover a child differs from its parent only through mutation
	std::set<std::vector<double>> seen;
	std::uint64_t gen = 0;
	std::size_t early = 0;
	std::size_t late = 0;

	auto recording = std::make_shared<FunctionObjective>(2, [&](const std::vector<double> &x) -> TFitness {
		if (seen.insert(x).second) (gen < 100 ? early : late)++;
		return x[0] * x[0] + x[1] * x[1];
	});

	Solver::build(std::make_unique<mh::Rga>(settings), recording, Bounds::uniform(2, -5.0, 5.0))
	    .seed(1)
	    .popNum(20)
	    .parallel(false)
	    .task(task::MaxGen(200))
	    .callback([&](const Context &ctx) { gen = ctx.gen(); })
	    .solve();

	// generations 101 to 200 are evaluated after the callback of generation 100
	REQUIRE(early > 0);
	REQUIRE(late > 20 * 50);
}

TEST_CASE("Invalid fitness values", "[solver]") {
	SECTION("NaN results are demoted and counted") {
		auto halfNaN = std::make_shared<FunctionObjective>(2, [](const std::vector<double> &x) -> TFitness {
			if (x[0] > 0.0) return NaN;
			return x[0] * x[0] + x[1] * x[1];
		});

		const Report r = Solver::build(std::make_unique<mh::Rga>(), halfNaN, Bounds::uniform(2, -1.0, 1.0))
		                     .seed(5)
		                     .popNum(20)
		                     .task(task::MaxGen(20))
		                     .solve();
		REQUIRE(r.bestFitness().isValid());
		REQUIRE(r.bestParameters()[0] <= 0.0);
	}

	SECTION("a generation with no valid candidate exhausts the run") {
		auto allNaN = std::make_shared<FunctionObjective>(2, [](const std::vector<double> &) { return NaN; });
		try {
			Solver::build(std::make_unique<mh::De>(), allNaN, Bounds::uniform(2, -1.0, 1.0)).popNum(8).solve();
			FAIL("RunExhausted expected");
		} catch (const RunExhausted &e) {
			REQUIRE(e.gen() == 0);
		}
	}

	SECTION("results of the wrong arity are invalid") {
		auto scalar = std::make_shared<FunctionObjective>(1, [](const std::vector<double> &x) { return x[0]; }, 2);
		REQUIRE_THROWS_AS(Solver::build(std::make_unique<mh::De>(), scalar, Bounds::uniform(1, -1.0, 1.0)).popNum(8).solve(),
		                  RunExhausted);
	}

	SECTION("objective exceptions propagate unchanged") {
		auto throwing = std::make_shared<FunctionObjective>(2, [](const std::vector<double> &) -> TFitness {
			throw std::domain_error("outside the model");
		});
		REQUIRE_THROWS_AS(Solver::build(std::make_unique<mh::De>(), throwing, Bounds::uniform(2, -1.0, 1.0)).popNum(8).solve(),
		                  std::domain_error);
		REQUIRE_THROWS_AS(Solver::build(std::make_unique<mh::De>(), throwing, Bounds::uniform(2, -1.0, 1.0))
		                      .popNum(8)
		                      .parallel(true)
		                      .solve(),
		                  std::domain_error);
	}
}

TEST_CASE("Product payload travels with the best fitness", "[solver]") {
	auto labelled = std::make_shared<FunctionObjective>(1, [](const std::vector<double> &x) {
		return TFitness({x[0] * x[0]}, std::string(x[0] < 0.0 ? "negative" : "positive"));
	});

	const Report r = Solver::build(std::make_unique<mh::De>(), labelled, Bounds::uniform(1, 0.5, 1.0))
	                     .seed(1)
	                     .popNum(8)
	                     .task(task::MaxGen(10))
	                     .solve();
	REQUIRE(r.hasProduct());
	REQUIRE(r.product<std::string>() == "positive");
	REQUIRE_THROWS_AS(r.product<int>(), std::bad_any_cast);
}

TEST_CASE("Two-objective Pareto front", "[solver]") {
	auto schaffer = std::make_shared<problems::Schaffer>();
	const Report r = Solver::build(std::make_unique<mh::De>(), schaffer, Bounds::uniform(1, -10.0, 10.0))
	                     .seed(0)
	                     .popNum(40)
	                     .paretoLimit(20)
	                     .task(task::MaxGen(100))
	                     .solve();

	const auto &front = r.front();
	REQUIRE(front.size() > 1);
	REQUIRE(front.size() <= 20);
	for (const auto &m : front) {
		REQUIRE(m.x[0] >= -1e-2);
		REQUIRE(m.x[0] <= 2.0 + 1e-2);
		for (const auto &o : front) REQUIRE_FALSE(Dominates(o.f, m.f));
	}

	// the front reaches both ends of the optimal set, extremes survive the limit
	const auto [lo, hi] = std::ranges::minmax(front | std::views::transform([](const TIndividual &m) { return m.x[0]; }));
	REQUIRE(lo < 0.05);
	REQUIRE(hi > 1.95);
}

TEST_CASE("Context evaluation accounting", "[context]") {
	auto pair = std::make_shared<FunctionObjective>(2, [](const std::vector<double> &x) -> TFitness {
		if (x[0] < 0.0) return x[0];    // one value where two are expected
		return std::vector<double>{x[0], x[1]};
	}, 2);

	TRunData runData;
	runData.popNum = 4;
	Context ctx(pair, Bounds::uniform(2, -1.0, 1.0), runData, 17);

	REQUIRE(ctx.seed() == 17);
	REQUIRE(ctx.isMulti());
	REQUIRE(ctx.gen() == 0);

	const TFitness good = ctx.evaluate({0.5, 0.25});
	REQUIRE(good.isValid());
	REQUIRE(good.arity() == 2);

	const TFitness bad = ctx.evaluate({-0.5, 0.25});
	REQUIRE_FALSE(bad.isValid());
	REQUIRE(bad.arity() == 2);

	const auto batch = ctx.makeIndividuals({{0.1, 0.3}, {-0.1, 0.1}, {0.2, 0.2}});
	REQUIRE(batch.size() == 3);
	REQUIRE(batch[1].x == std::vector<double>{-0.1, 0.1});
	REQUIRE_FALSE(batch[1].f.isValid());

	REQUIRE(ctx.evaluations() == 5);
	REQUIRE(ctx.genEvaluations() == 5);
	REQUIRE(ctx.genInvalid() == 2);

	ctx.setPopulation(batch);
	REQUIRE(ctx.findBest());
	REQUIRE(ctx.best().size() == 2);
	for (const auto &m : ctx.best().front()) REQUIRE(m.f.isValid());
}
