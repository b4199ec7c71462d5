#include <railpath/level.hpp>
#include <railpath/log.hpp>
#include <railpath/orbit.hpp>
#include <railpath/viewer/app.hpp>

using namespace railpath;

namespace {

// Straight run with one twirl, used when no level path is given.
constexpr const char* kSampleLevel = R"({
  "pathData": "RRRRRRRRRRRRRRRR",
  "settings": {"bpm": 120},
  "actions": [
    {"floor": 8, "eventType": "Twirl"},
  ],
})";

} // namespace

int main(int argc, char** argv) {
  init_log_level_from_env();

  LoadResult loaded = (argc > 1) ? load_level_file(argv[1]) : load_level(kSampleLevel);
  if (!loaded) {
    RAILPATH_LOGE("viewer") << loaded.error.message;
    return 1;
  }

  // Unit tile spacing: the orbit radius has to match it for crossings to occur.
  OrbitConfig cfg;
  cfg.radius = 1.0;
  OrbitSimulator sim(*loaded.level, cfg);

  ViewerApp app(*loaded.level, sim);
  return app.run();
}
