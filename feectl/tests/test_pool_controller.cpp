#include <catch2/catch_test_macros.hpp>
#include "../src/pool_controller.hpp"
#include "../src/errors.hpp"
#include "../src/util.hpp"
#include <memory>

static PoolParams standard_params() {
    return FeeSettings::defaults().categories.at(PoolCategory::Standard);
}

static PoolFeeController make_controller(const Clock& clock) {
    return PoolFeeController("pool-a", PoolCategory::Standard, SanityBounds(), WAD,
                             std::make_shared<FeeLogicV1>(), clock);
}

TEST_CASE("Controller activation", "[pool_controller]") {
    ManualClock clock(1000);
    PoolFeeController controller = make_controller(clock);

    SECTION("Starts inactive and rejects updates") {
        REQUIRE_FALSE(controller.is_active());
        REQUIRE_THROWS_AS(controller.preview_update(WAD), NotActive);
        REQUIRE_THROWS_AS(controller.commit_update(WAD), NotActive);
        REQUIRE_THROWS_AS(controller.set_params(standard_params()), NotActive);
        REQUIRE_THROWS_AS(controller.deactivate(), NotActive);
    }

    SECTION("Initialize sets fee, target and timestamp") {
        controller.initialize(5000, WAD, standard_params());
        REQUIRE(controller.is_active());
        REQUIRE(controller.current_fee() == 5000);
        REQUIRE(controller.current_target_ratio() == WAD);
        REQUIRE(controller.oob_state() == OobState{false, 0});
        REQUIRE(controller.state().last_update_ts == 1000);
        REQUIRE(controller.next_eligible_update() == 4600);
        REQUIRE(controller.logic_version() == 1);
    }

    SECTION("Fee outside the range is rejected") {
        REQUIRE_THROWS_AS(controller.initialize(99, WAD, standard_params()), InvalidFee);
        REQUIRE_THROWS_AS(controller.initialize(10001, WAD, standard_params()), InvalidFee);
        REQUIRE_FALSE(controller.is_active());
    }

    SECTION("Zero or oversized target is rejected") {
        REQUIRE_THROWS_AS(controller.initialize(5000, Wad(0), standard_params()), InvalidRatio);
        REQUIRE_THROWS_AS(controller.initialize(5000, WAD * 1001, standard_params()), InvalidRatio);
        REQUIRE_FALSE(controller.is_active());
    }

    SECTION("Invalid params are rejected before the fee is checked") {
        PoolParams broken = standard_params();
        broken.min_period = 1;
        REQUIRE_THROWS_AS(controller.initialize(1, WAD, broken), InvalidParameter);
    }

    SECTION("Second initialize is rejected") {
        controller.initialize(5000, WAD, standard_params());
        REQUIRE_THROWS_AS(controller.initialize(4000, WAD, standard_params()), InvalidParameter);
        REQUIRE(controller.current_fee() == 5000);
    }

    SECTION("Deactivate clears state and allows re-initialization") {
        controller.initialize(5000, WAD, standard_params());
        controller.deactivate();
        REQUIRE_FALSE(controller.is_active());
        REQUIRE(controller.current_fee() == 0);
        REQUIRE_THROWS_AS(controller.commit_update(WAD), NotActive);

        clock.advance(10);
        controller.initialize(2000, WAD * 2, standard_params());
        REQUIRE(controller.current_fee() == 2000);
        REQUIRE(controller.state().last_update_ts == 1010);
    }
}

TEST_CASE("Controller cooldown", "[pool_controller]") {
    ManualClock clock(1000);
    PoolFeeController controller = make_controller(clock);
    controller.initialize(5000, WAD, standard_params());
    Wad ratio = util::parse_wad("1.2");

    SECTION("Commit before cooldown is rejected and changes nothing") {
        clock.advance(3599);
        try {
            controller.commit_update(ratio);
            FAIL("expected CooldownNotElapsed");
        } catch (const CooldownNotElapsed& e) {
            REQUIRE(e.now() == 4599);
            REQUIRE(e.next_eligible() == 4600);
        }
        REQUIRE(controller.current_fee() == 5000);
        REQUIRE(controller.state().last_update_ts == 1000);
    }

    SECTION("Commit exactly at the eligible time succeeds") {
        clock.advance(3600);
        FeeUpdate update = controller.commit_update(ratio);
        REQUIRE(update.old_fee == 5000);
        REQUIRE(update.new_fee == 5050);
        REQUIRE(update.old_target == WAD);
        REQUIRE(update.new_target == Wad(1012903225806451612ULL));
        REQUIRE(controller.current_fee() == 5050);
        REQUIRE(controller.current_target_ratio() == update.new_target);
        REQUIRE(controller.oob_state() == OobState{true, 1});
        REQUIRE(controller.state().last_update_ts == 4600);
        REQUIRE(controller.next_eligible_update() == 8200);
    }

    SECTION("Back-to-back commits are rate limited") {
        clock.advance(3600);
        controller.commit_update(ratio);
        REQUIRE_THROWS_AS(controller.commit_update(ratio), CooldownNotElapsed);

        clock.advance(3600);
        FeeUpdate second = controller.commit_update(ratio);
        REQUIRE(second.old_fee == 5050);
        REQUIRE(second.new_fee > 5050);
        REQUIRE(controller.oob_state() == OobState{true, 2});
        REQUIRE(controller.state().last_update_ts == 8200);
    }

    SECTION("In-band observation still consumes the cooldown") {
        clock.advance(3600);
        FeeUpdate update = controller.commit_update(WAD);
        REQUIRE(update.new_fee == 5000);
        REQUIRE(controller.state().last_update_ts == 4600);
        REQUIRE_THROWS_AS(controller.commit_update(WAD), CooldownNotElapsed);
    }
}

TEST_CASE("Controller rejects bad observations", "[pool_controller]") {
    ManualClock clock(1000);
    PoolFeeController controller = make_controller(clock);
    controller.initialize(5000, WAD, standard_params());
    clock.advance(3600);
    PoolFeeState before = controller.state();

    SECTION("Zero ratio") {
        REQUIRE_THROWS_AS(controller.commit_update(Wad(0)), InvalidRatio);
    }

    SECTION("Ratio above max_current_ratio") {
        REQUIRE_THROWS_AS(controller.commit_update(WAD * 1000 + 1), InvalidRatio);
    }

    REQUIRE(controller.current_fee() == before.current_fee);
    REQUIRE(controller.current_target_ratio() == before.current_target_ratio);
    REQUIRE(controller.state().last_update_ts == before.last_update_ts);
    // A rejected observation does not use up the window
    REQUIRE_NOTHROW(controller.commit_update(WAD));
}

TEST_CASE("Controller preview", "[pool_controller]") {
    ManualClock clock(1000);
    PoolFeeController controller = make_controller(clock);
    controller.initialize(5000, WAD, standard_params());
    Wad ratio = util::parse_wad("0.8");

    SECTION("Preview ignores the cooldown and mutates nothing") {
        FeeUpdate preview = controller.preview_update(ratio);
        REQUIRE(preview.new_fee == 4950);
        REQUIRE(controller.current_fee() == 5000);
        REQUIRE(controller.oob_state() == OobState{false, 0});
        REQUIRE(controller.state().last_update_ts == 1000);
    }

    SECTION("Preview rejects the same ratios as commit") {
        REQUIRE_THROWS_AS(controller.preview_update(Wad(0)), InvalidRatio);
        REQUIRE_THROWS_AS(controller.preview_update(WAD * 1000 + 1), InvalidRatio);
        REQUIRE(controller.current_fee() == 5000);
        REQUIRE(controller.current_target_ratio() == WAD);
        REQUIRE(controller.oob_state() == OobState{false, 0});
        REQUIRE(controller.state().last_update_ts == 1000);
    }

    SECTION("Preview of the largest accepted ratio succeeds") {
        REQUIRE_NOTHROW(controller.preview_update(WAD * 1000));
    }

    SECTION("Preview matches the following commit") {
        clock.advance(3600);
        FeeUpdate preview = controller.preview_update(ratio);
        FeeUpdate committed = controller.commit_update(ratio);
        REQUIRE(preview.new_fee == committed.new_fee);
        REQUIRE(preview.new_target == committed.new_target);
        REQUIRE(preview.new_oob == committed.new_oob);
    }
}

TEST_CASE("Controller administration", "[pool_controller]") {
    ManualClock clock(1000);
    PoolFeeController controller = make_controller(clock);
    controller.initialize(5000, WAD, standard_params());
    clock.advance(3600);

    SECTION("New params apply to the next commit") {
        PoolParams capped = standard_params();
        capped.max_fee = 5020;
        controller.set_params(capped);
        REQUIRE(controller.current_fee() == 5000);
        FeeUpdate update = controller.commit_update(util::parse_wad("1.2"));
        REQUIRE(update.new_fee == 5020);
    }

    SECTION("Invalid params leave the old set in place") {
        PoolParams broken = standard_params();
        broken.min_fee = 20000;
        REQUIRE_THROWS_AS(controller.set_params(broken), InvalidParameter);
        REQUIRE(controller.params() == standard_params());
    }

    SECTION("Longer min_period extends the current cooldown") {
        PoolParams slow = standard_params();
        slow.min_period = 7200;
        controller.set_params(slow);
        REQUIRE(controller.next_eligible_update() == 8200);
        REQUIRE_THROWS_AS(controller.commit_update(WAD), CooldownNotElapsed);
    }

    SECTION("Lower adjustment rate ceiling limits the step") {
        controller.set_adjustment_rate_ceiling(util::parse_wad("0.001"));
        FeeUpdate update = controller.commit_update(util::parse_wad("1.2"));
        REQUIRE(update.new_fee == 5006);
    }

    SECTION("Adjustment rate ceiling is validated") {
        REQUIRE_THROWS_AS(controller.set_adjustment_rate_ceiling(Wad(0)), InvalidParameter);
        REQUIRE(controller.adjustment_rate_ceiling() == WAD);
    }

    SECTION("Null logic is rejected") {
        REQUIRE_THROWS_AS(controller.set_logic(nullptr), InvalidParameter);
        REQUIRE(controller.logic_version() == 1);
    }
}
