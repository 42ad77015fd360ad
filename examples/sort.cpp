#include <print>

#include "yamlsort/yamlsort.hpp"

int main() {

    yamlsort::value v;
    v["spec"]["replicas"] = 3;
    v["spec"]["selector"] = yamlsort::mapping{};
    v["kind"] = "Deployment";
    v["name"] = "web";
    v["spec"]["containers"][0]["name"] = "nginx";
    v["spec"]["containers"][0]["image"] = "nginx:1.25";
    v["spec"]["containers"][0]["ports"][0]["containerPort"] = 8080;
    v["spec"]["containers"][0]["ports"][0]["protocol"] = "TCP";
    v["spec"]["containers"][0]["args"][0] = "--debug";
    v["spec"]["containers"][0]["args"][1] = "on";

    auto out = yamlsort::serialize(v);
    if (!out) {
        std::println(stderr, "{}", out.error().msg);
        return 1;
    }
    std::print("{}", *out);

    auto parsed = yamlsort::load("b: 2\na: \"1\"\nname: x\ntags: [yes, 'no']\n");
    if (!parsed) {
        std::println(stderr, "Parse error! -> {}", parsed.error().msg);
        return 1;
    }

    // "tags" holds a boolean, which the emitter refuses
    auto refused = yamlsort::serialize(*parsed);
    if (!refused) std::println("\n{}", refused.error().msg);

    auto& m = parsed->as_mapping();
    if (auto it = m.find("tags"); it != m.end()) m.erase(it);
    std::println("\n{}", *yamlsort::serialize(*parsed, { .quote_strings = true }));

    return 0;
}
