#include <keycase/core.h>
#include <keycase/json/encoder.h>
#include <keycase/plug/SnakeCaseParams.h>

using namespace keycase;

int main(int argc, char** argv) {
    // outbound: snake_case tree to camelCase JSON
    Value user = Map{
        {"user_id", 1},
        {"user_info", Map{{"first_name", "John"}, {"last_name", "Doe"}}},
        {"birth_date", make_record<Date>(1990, 7, 14)},
        {"post_ids", List{10, 11}}
    };
    std::cout << json::encode(user, json::EncodeOptions{.pretty = true}) << std::endl;

    // inbound: camelCase params to snake_case
    plug::Request request;
    request.method = "POST";
    request.path = "/users";
    request.params = Map{{"userInfo"_sym, Map{{"firstName"_sym, "Jane"}}}};
    std::cout << "params=" << plug::SnakeCaseParams{}(request).params << std::endl;

    // single keys
    std::cout << to_camel_case("user_first_name") << ' ' << to_snake_case("APIResponse") << std::endl;
}
