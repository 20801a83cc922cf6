#include <schemac.hpp>
#include <iostream>

// Example: validating service configuration documents
//
// Builds one schema, then validates several candidate documents against it.
// The schema is compiled on the first validation; every later document only
// runs the cached checks.
//
// Usage:
//   ./schemac_example_validate_config
//
// Set SCHEMAC_LOG_LEVEL=DEBUG to see each schema node being compiled.

int main()
{
    using schemac::Json;

    auto settings = schemac::Settings::from_env();
    schemac::log::set_level(schemac::log::level_from_string(settings.log_level));

    // ============================================================================
    // Step 1: Describe the configuration
    // ============================================================================

    schemac::Schema schema(
        Json{{"type", "object"},
             {"required", Json::array({"name", "port"})},
             {"additionalProperties", false},
             {"properties",
              Json{{"name", Json{{"type", "string"}, {"minLength", 1}}},
                   {"port", Json{{"type", "integer"}, {"minimum", 1}, {"maximum", 65535}}},
                   {"ratio", Json{{"type", "number"}, {"multipleOf", 0.25}}},
                   {"tls", Json{{"type", "object"}, {"required", Json::array({"cert"})}}}}},
             {"dependencies", Json{{"tls", Json::array({"port"})}}},
             {"patternProperties", Json{{"^x-", Json::object()}}}},
        settings);

    // ============================================================================
    // Step 2: Validate documents
    // ============================================================================

    const Json documents[] = {
        Json{{"name", "api"}, {"port", 8080}},
        Json{{"name", "api"}, {"port", 70000}},
        Json{{"name", "api"}, {"port", 443}, {"tls", Json{{"cert", "/etc/cert.pem"}}}},
        Json{{"name", "api"}, {"port", 443}, {"ratio", 0.3}},
        Json{{"name", "api"}, {"port", 443}, {"x-team", "core"}},
        Json{{"name", "api"}, {"port", 443}, {"debug", true}},
        Json{{"port", 443}},
    };

    int failures = 0;
    for (const auto& doc : documents)
    {
        try
        {
            schema.validate(doc);
            std::cout << "VALID    " << doc.dump() << "\n";
        }
        catch (const schemac::ValidationError& e)
        {
            ++failures;
            std::cout << "INVALID  " << doc.dump() << "\n         " << e.what() << " ("
                      << schemac::reason_string(e.reason()) << ")\n";
        }
    }

    std::cout << "\n" << schema.compiled_nodes() << " schema node(s) compiled, " << failures
              << " invalid document(s)\n";
    return 0;
}
