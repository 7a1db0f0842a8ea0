#include "../engine/config.hpp"
#include "../engine/pile.hpp"
#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace compost;

static bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

static void writeFile(const char* path, const std::string& text) {
    std::ofstream f(path);
    f << text;
}

int main() {
    const char* path = "config_test.cfg";
    std::vector<LogMsg> log;
    StepOpts opt = quietOpts();
    opt.sink = [&log](const LogMsg& m){ log.push_back(m); };

    // Defaults.
    {
        Config c;
        assert(c.maxCapacity == 64);
        assert(c.bulkAddAmount == 4);
        assert(c.hoursToComplete == 240);
        assert(c.shovelSpeedupHours == 5);
        assert(c.turnCooldownHours == 5);
        assert(near(c.optimalCNRatio, 27.5));
        assert(near(c.outputPerItem, 0.5));
        assert(near(c.waterAmount, 0.2));
        assert(near(c.dryMaterialAmount, 0.15));
        assert(!sanitizeConfig(c));
    }

    // Sanitizing clamps unusable values.
    {
        Config c;
        c.hoursToComplete = 0;
        c.maxCapacity = -3;
        c.waterAmount = 4.0;
        assert(sanitizeConfig(c));
        assert(c.hoursToComplete == 1);
        assert(c.maxCapacity == 1);
        assert(near(c.waterAmount, 1.0));
    }

    // Save then load.
    {
        Config c;
        c.hoursToComplete = 96;
        c.greenCNRatio = 12.5;
        c.waterAmount = 0.35;
        assert(saveConfig(c, path));

        Config d;
        assert(loadConfig(d, path, opt));
        assert(d.hoursToComplete == 96);
        assert(near(d.greenCNRatio, 12.5));
        assert(near(d.waterAmount, 0.35));
        assert(d.maxCapacity == 64);
    }

    // Comments, blanks, spacing and unknown keys.
    {
        writeFile(path,
                  "# compost tuning\n"
                  "\n"
                  "hoursToComplete = 120   # faster\n"
                  "bogus=3\n"
                  "not a pair\n"
                  "waterAmount=0.3\n");
        log.clear();
        Config c;
        assert(loadConfig(c, path, opt));
        assert(c.hoursToComplete == 120);
        assert(near(c.waterAmount, 0.3));

        int warnings = 0;
        for (const LogMsg& m : log) if (m.kind == LogKind::Warning) ++warnings;
        assert(warnings == 2);
        assert(log.back().kind == LogKind::Info);
    }

    // Bad values fail without touching the config.
    {
        writeFile(path, "hoursToComplete=48\nmaxCapacity=lots\n");
        Config c;
        assert(!loadConfig(c, path, opt));
        assert(c.hoursToComplete == 240);
        assert(c.maxCapacity == 64);
    }

    // nan/inf are rejected like any other bad value.
    {
        writeFile(path, "waterAmount=nan\n");
        Config c;
        assert(!loadConfig(c, path, opt));
        assert(near(c.waterAmount, 0.2));

        writeFile(path, "optimalCNRatio=inf\n");
        assert(!loadConfig(c, path, opt));
        assert(near(c.optimalCNRatio, 27.5));
    }

    // Out-of-range values load clamped.
    {
        writeFile(path, "hoursToComplete=-5\n");
        log.clear();
        Config c;
        assert(loadConfig(c, path, opt));
        assert(c.hoursToComplete == 1);
        assert(log.size() == 2 && log[0].kind == LogKind::Warning);
    }

    // Missing file.
    {
        Config c;
        assert(!loadConfig(c, "no_such_compost.cfg", opt));
    }
    std::remove(path);

    // Piles read the config they were built with.
    {
        Config c;
        c.hoursToComplete = 120;
        c.shovelSpeedupHours = 6;
        c.turnCooldownHours = 2;
        CompostPile p(c);
        p.addMaterial(MaterialKind::Green, 4, 0.0);
        p.turn(0.0, quietOpts());
        assert(near(p.progress(), 6.0 / 120.0));
        assert(p.canTurn(2.0));
        assert(&p.config() == &c);
    }
    return 0;
}
