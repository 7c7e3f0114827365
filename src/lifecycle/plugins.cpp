#include <strata/plugin.hpp>
#include <strata/environment.hpp>

namespace strata {

namespace {

constexpr size_t kString = 0;
constexpr size_t kList = 3;

std::string joined_params(const PropertyMap& props, const std::string& key) {
    std::string out;
    for (const auto& p : get_list(props, key).value_or(std::vector<std::string>{})) {
        out += " ";
        out += shell_quote(p);
    }
    return out;
}

const char* kParallel = "-j\"${STRATA_PARALLEL_BUILD_COUNT}\"";

class NilPlugin : public Plugin {
public:
    Status validate_properties(const PropertyMap& props) const override {
        return check_schema(props, {}, "nil");
    }
    std::vector<std::string> build_commands(const PluginContext&) const override {
        return {};
    }
};

// Copies the part's sources verbatim into the install directory
class DumpPlugin : public Plugin {
public:
    Status validate_properties(const PropertyMap& props) const override {
        return check_schema(props, {}, "dump");
    }
    bool requires_source() const override { return true; }
    std::vector<std::string> build_commands(const PluginContext&) const override {
        return {"cp -a . \"${STRATA_PART_INSTALL}\""};
    }
};

class MakePlugin : public Plugin {
public:
    Status validate_properties(const PropertyMap& props) const override {
        return check_schema(props, {{"make-parameters", kList, false}}, "make");
    }
    std::vector<std::string> build_packages(const PluginContext&) const override {
        return {"gcc", "make"};
    }
    std::vector<std::string> build_commands(const PluginContext& ctx) const override {
        auto params = joined_params(ctx.properties, "make-parameters");
        return {
            std::string("make ") + kParallel + params,
            std::string("make ") + kParallel + " install" + params
                + " DESTDIR=\"${STRATA_PART_INSTALL}\"",
        };
    }
};

class CMakePlugin : public Plugin {
public:
    Status validate_properties(const PropertyMap& props) const override {
        STRATA_TRY(check_schema(props, {
            {"cmake-parameters", kList, false},
            {"cmake-generator", kString, false},
        }, "cmake"));
        auto gen = get_string(props, "cmake-generator");
        if (gen && *gen != "Unix Makefiles" && *gen != "Ninja") {
            return StrataError{StrataError::PropertyValidation,
                "unsupported cmake-generator '" + *gen + "'",
                "use \"Unix Makefiles\" or \"Ninja\""};
        }
        return ok_status();
    }
    bool out_of_source_build() const override { return true; }
    std::vector<std::string> build_packages(const PluginContext& ctx) const override {
        std::vector<std::string> pkgs{"gcc", "cmake"};
        if (generator(ctx) == "Ninja") pkgs.push_back("ninja-build");
        return pkgs;
    }
    EnvironmentList build_environment(const PluginContext&) const override {
        return {{"CMAKE_PREFIX_PATH", "${STRATA_STAGE}"}};
    }
    std::vector<std::string> build_commands(const PluginContext& ctx) const override {
        return {
            "cmake \"${STRATA_PART_SRC_WORK}\" -G " + shell_quote(generator(ctx))
                + joined_params(ctx.properties, "cmake-parameters"),
            "cmake --build . --parallel \"${STRATA_PARALLEL_BUILD_COUNT}\"",
            "DESTDIR=\"${STRATA_PART_INSTALL}\" cmake --build . --target install",
        };
    }

private:
    static std::string generator(const PluginContext& ctx) {
        return get_string(ctx.properties, "cmake-generator").value_or("Unix Makefiles");
    }
};

class AutotoolsPlugin : public Plugin {
public:
    Status validate_properties(const PropertyMap& props) const override {
        return check_schema(props, {{"autotools-configure-parameters", kList, false}},
                            "autotools");
    }
    std::vector<std::string> build_packages(const PluginContext&) const override {
        return {"autoconf", "automake", "autopoint", "gcc", "libtool", "make"};
    }
    std::vector<std::string> build_commands(const PluginContext& ctx) const override {
        return {
            "if [ ! -f ./configure ]; then if [ -f ./autogen.sh ]; then env NOCONFIGURE=1 ./autogen.sh; "
                "elif [ -f ./bootstrap ]; then env NOCONFIGURE=1 ./bootstrap; "
                "else autoreconf --install; fi; fi",
            "./configure" + joined_params(ctx.properties, "autotools-configure-parameters"),
            std::string("make ") + kParallel,
            std::string("make ") + kParallel + " install DESTDIR=\"${STRATA_PART_INSTALL}\"",
        };
    }
};

} // namespace

PluginHandle make_nil_plugin() { return std::make_shared<NilPlugin>(); }
PluginHandle make_dump_plugin() { return std::make_shared<DumpPlugin>(); }
PluginHandle make_make_plugin() { return std::make_shared<MakePlugin>(); }
PluginHandle make_cmake_plugin() { return std::make_shared<CMakePlugin>(); }
PluginHandle make_autotools_plugin() { return std::make_shared<AutotoolsPlugin>(); }

} // namespace strata
