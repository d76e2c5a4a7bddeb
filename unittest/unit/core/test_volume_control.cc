#include <doctest/doctest.h>
#include <segue/volume_control.hh>
#include <cmath>

using namespace segue;

TEST_SUITE("VolumeControl") {
    TEST_CASE("levels are clamped to the percent scale") {
        volume_control volume;
        CHECK(volume.level() == 80);

        CHECK(volume.set_level(150) == 100);
        CHECK(volume.set_level(-5) == 0);
        CHECK(volume.set_level(42) == 42);

        volume_control loud(250);
        CHECK(loud.level() == 100);
    }

    TEST_CASE("mute and unmute restore the previous level") {
        volume_control volume(70);

        CHECK(volume.mute());
        CHECK(volume.is_muted());
        CHECK(volume.effective_level() == 0);
        CHECK(volume.level() == 70);
        CHECK(volume.previous_level() == 70);
        CHECK_FALSE(volume.mute());

        CHECK(volume.unmute());
        CHECK_FALSE(volume.is_muted());
        CHECK(volume.effective_level() == 70);
        CHECK_FALSE(volume.unmute());
    }

    TEST_CASE("a level set while muted is restored by unmute") {
        volume_control volume(70);
        volume.mute();
        volume.set_level(30);

        CHECK(volume.effective_level() == 0);
        volume.unmute();
        CHECK(volume.level() == 30);
    }

    TEST_CASE("gain mapping") {
        volume_control volume(100);
        CHECK(volume.gain_db() == doctest::Approx(0.0f));
        CHECK(volume.linear_gain() == doctest::Approx(1.0f));

        volume.set_level(50);
        CHECK(volume.gain_db() == doctest::Approx(-30.0f));
        CHECK(volume.linear_gain() == doctest::Approx(std::pow(10.0f, -1.5f)));

        volume.set_level(0);
        CHECK(std::isinf(volume.gain_db()));
        CHECK(volume.linear_gain() == 0.0f);

        volume.set_level(100);
        volume.mute();
        CHECK(volume.linear_gain() == 0.0f);
    }
}
