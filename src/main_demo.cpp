#include "common/config.hpp"
#include "descriptor/descriptor_registry.hpp"
#include "descriptor/enum_traits.hpp"
#include "host/enum_loader.hpp"
#include "host/sample_enums.hpp"

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace sbr {

class RegistryDemo {
public:
    explicit RegistryDemo(const Config& config) : config_(config) {
        style_ = parse_format_style(config_.codec.style).value_or(FormatStyle::General);
    }

    // Returns false when a sample enum fails to register.
    bool setup() {
        spdlog::info("Registering sample enums...");

        bool ok = register_typed<samples::Priority>()
               && register_typed<samples::BorderSides>()
               && register_typed<samples::FileSize>()
               && register_typed<samples::DaysOfWeek>()
               && register_typed<samples::FilePermissions>()
               && register_typed<samples::HttpStatusCode>()
               && register_typed<samples::FeatureFlags>();
        if (!ok) {
            return false;
        }

        register_declarations(registry_, config_.enums);

        for (const auto& type_id : registry_.type_ids()) {
            if (auto descriptor = registry_.find(type_id)) {
                spdlog::debug("{}", describe(*descriptor).dump());
            }
        }

        spdlog::info("Registry holds {} enums", registry_.size());
        return true;
    }

    void run() {
        show_integral_conversions();
        show_text_formats();
        show_permissive_casts();
        show_parsing();
        show_enumeration();
        show_flags();
        show_configured_samples();

        const auto& stats = registry_.get_stats();
        spdlog::info("Registry stats: lookups={} hits={} builds={} failures={}",
                     stats.lookups.load(), stats.hits.load(), stats.builds.load(),
                     stats.build_failures.load());
    }

private:
    template <DescribedEnum E>
    bool register_typed() {
        auto view = view_of<E>(registry_);
        if (!view) {
            spdlog::error("Failed to register {}: {}", EnumTraits<E>::type_id, to_string(view.error()));
            return false;
        }
        return true;
    }

    template <DescribedEnum E>
    EnumView<E> view() {
        // setup() has already published every sample descriptor
        return view_of<E>(registry_).value();
    }

    void show_integral_conversions() {
        spdlog::info("=== Integral conversions ===");

        auto sides = view<samples::BorderSides>();
        auto combined = samples::BorderSides::Left | samples::BorderSides::Right;
        spdlog::info("Left | Right = {}", to_decimal(sides.to_integral(combined).value()));

        auto sizes = view<samples::FileSize>();
        for (auto size : sizes.values()) {
            spdlog::info("FileSize {} = {} bytes", sizes.to_string(size),
                         to_decimal(sizes.to_integral(size).value()));
        }

        auto permissions = view<samples::FilePermissions>();
        auto overflow = to_integral(permissions.descriptor(), 999);
        if (!overflow) {
            spdlog::info("999 as FilePermissions: {}", to_string(overflow.error()));
        }
    }

    void show_text_formats() {
        spdlog::info("=== Text formats ===");

        auto sides = view<samples::BorderSides>();
        auto combined = samples::BorderSides::Left | samples::BorderSides::Right;
        for (auto style : {FormatStyle::General, FormatStyle::Flags, FormatStyle::Decimal, FormatStyle::Hex}) {
            spdlog::info("Top: {:<8} Left|Right: {}",
                         sides.to_string(samples::BorderSides::Top, style),
                         sides.to_string(combined, style));
        }
    }

    void show_permissive_casts() {
        spdlog::info("=== Integral to enum ===");

        auto priorities = view<samples::Priority>();
        auto high = priorities.from_integral(3);
        spdlog::info("3 -> {}", priorities.to_string(high));

        // Undefined values pass through from_integral and stay inspectable
        auto invalid = priorities.from_integral(999);
        spdlog::info("999 -> {} (defined: {})", priorities.to_string(invalid), priorities.is_defined(invalid));

        auto checked = priorities.from_integral_checked(999);
        spdlog::info("999 checked -> {}", checked ? priorities.to_string(*checked) : std::string("rejected"));

        auto days = view<samples::DaysOfWeek>();
        auto all_bits = days.from_integral(255);
        spdlog::info("255 as DaysOfWeek -> {} (exact union: {})",
                     days.to_string(all_bits, style_), days.is_exact_union(all_bits));
    }

    void show_parsing() {
        spdlog::info("=== Parsing ===");

        auto sides = view<samples::BorderSides>();
        auto priorities = view<samples::Priority>();

        for (const char* text : {"High", "critical", "Left, Right", "Left,Bogus", "", "7"}) {
            auto parsed = sides.parse(text, config_.codec.case_sensitive);
            if (parsed) {
                spdlog::info("'{}' -> BorderSides {}", text, sides.to_string(parsed.value()));
                continue;
            }

            auto priority = priorities.parse(text, config_.codec.case_sensitive);
            if (priority) {
                spdlog::info("'{}' -> Priority {}", text, priorities.to_string(priority.value()));
            } else {
                spdlog::warn("'{}' rejected: {}", text, to_string(priority.error()));
            }
        }
    }

    void show_enumeration() {
        spdlog::info("=== Enumerating members ===");

        auto codes = view<samples::HttpStatusCode>();
        for (const auto& member : codes.descriptor().members()) {
            spdlog::info("  {} = {}", member.name, to_decimal(member.value));
        }
        spdlog::info("HttpStatusCode has {} members, 404 defined: {}, 418 defined: {}",
                     codes.descriptor().size(), codes.descriptor().is_defined(404),
                     codes.descriptor().is_defined(418));
    }

    void show_flags() {
        spdlog::info("=== Flags ===");

        auto days = view<samples::DaysOfWeek>();
        auto meetings = samples::DaysOfWeek::Monday | samples::DaysOfWeek::Wednesday | samples::DaysOfWeek::Friday;
        auto work = samples::DaysOfWeek::Weekdays;

        spdlog::info("Work days: {}", days.to_string(work));
        spdlog::info("Work days (flags): {}", days.to_string(work, FormatStyle::Flags));
        spdlog::info("Meeting days: {}", days.to_string(meetings));
        spdlog::info("Work days without meetings: {}", days.to_string(work & ~meetings));
        spdlog::info("Number of work days: {}", days.count_set_flags(work));
        spdlog::info("Saturday is a work day: {}", days.has_flag(work, samples::DaysOfWeek::Saturday));

        auto features = view<samples::FeatureFlags>();
        for (auto profile : {samples::FeatureFlags::StandardUser, samples::FeatureFlags::PowerUser,
                             samples::FeatureFlags::Developer}) {
            std::string enabled;
            for (auto feature : features.decompose(profile)) {
                if (!enabled.empty()) {
                    enabled += MEMBER_SEPARATOR;
                }
                enabled += features.to_string(feature);
            }
            spdlog::info("{}: {}", features.to_string(profile), enabled);
        }
    }

    void show_configured_samples() {
        if (config_.samples.empty()) {
            return;
        }
        spdlog::info("=== Configured samples ===");

        for (const auto& sample : config_.samples) {
            auto descriptor = registry_.find(sample.type_id);
            if (!descriptor) {
                spdlog::warn("Sample refers to unknown enum '{}'", sample.type_id);
                continue;
            }

            for (auto value : sample.values) {
                auto decomposition = decompose(*descriptor, value);
                spdlog::info("{} {} -> '{}' (unrecognized bits: 0x{})", sample.type_id, to_decimal(value),
                             format(*descriptor, value, style_),
                             to_hex(decomposition.unrecognized_bits, 1));
            }

            for (const auto& text : sample.texts) {
                auto parsed = parse(*descriptor, text, config_.codec.case_sensitive);
                if (parsed) {
                    spdlog::info("{} '{}' -> {}", sample.type_id, text, to_decimal(parsed.value()));
                } else {
                    spdlog::warn("{} '{}' rejected: {}", sample.type_id, text, to_string(parsed.error()));
                }
            }
        }
    }

    Config config_;
    FormatStyle style_ = FormatStyle::General;
    DescriptorRegistry registry_;
};

} // namespace sbr

int main(int argc, char* argv[]) {
    try {
        // Load configuration
        std::string config_path = "config.json";
        if (argc > 1) {
            config_path = argv[1];
        }

        sbr::Config config = sbr::Config::load_from_file(config_path);

        // Setup logging
        spdlog::set_level(spdlog::level::from_str(config.logging.level));
        spdlog::set_pattern(config.logging.pattern);
        spdlog::info("Loaded configuration from {}", config_path);

        auto demo = std::make_unique<sbr::RegistryDemo>(config);
        if (!demo->setup()) {
            spdlog::error("Sample enum registration failed");
            return 1;
        }
        demo->run();

        spdlog::info("Demo complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
