#include "dsup/network/http_router.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>

using dsup::network::HttpContext;
using dsup::network::HttpMethod;
using dsup::network::HttpRequest;
using dsup::network::HttpResponse;
using dsup::network::HttpRouter;
using dsup::network::HttpStatus;
using dsup::network::path_of;
using dsup::network::split_path;

namespace {

HttpRequest make_request(HttpMethod method, const std::string& url) {
    HttpRequest request;
    request.method = method;
    request.url = url;
    return request;
}

HttpResponse text(const std::string& body) {
    HttpResponse response(HttpStatus::OK);
    response.set_body(body);
    return response;
}

} // namespace

TEST(HttpRouterTest, ExtractsNamedParameters) {
    HttpRouter router;
    router.post("/source/:id/chunk/:seq_num/:byte_offset", [](const HttpContext& ctx) {
        return text(ctx.get_param("id") + "|" + ctx.get_param("seq_num") + "|" +
                    ctx.get_param("byte_offset"));
    });

    auto response = router.handle_request(make_request(HttpMethod::POST, "/source/12/chunk/3/300"));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body_as_string(), "12|3|300");
}

TEST(HttpRouterTest, MatchesMethodAndIgnoresQueryString) {
    HttpRouter router;
    router.get("/source/:id", [](const HttpContext&) { return text("show"); });
    router.post("/source/:id", [](const HttpContext&) { return text("update"); });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/source/1?verbose=1")).body_as_string(),
              "show");
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::POST, "/source/1")).body_as_string(),
              "update");
}

TEST(HttpRouterTest, WrongMethodOnKnownPathIs405) {
    HttpRouter router;
    router.get("/source/:id", [](const HttpContext&) { return text("show"); });
    router.post("/source/:id", [](const HttpContext&) { return text("update"); });

    auto response = router.handle_request(make_request(HttpMethod::PUT, "/source/1"));
    EXPECT_EQ(response.status_code, 405);
    EXPECT_EQ(response.get_header("Allow"), "GET, POST");

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::PUT, "/elsewhere")).status_code, 404);
}

TEST(HttpRouterTest, NumberParamRejectsNonDigits) {
    HttpRequest request;
    HttpContext ctx(request);
    ctx.params["seq"] = "42";
    ctx.params["neg"] = "-1";
    ctx.params["big"] = "18446744073709551616";
    ctx.params["max"] = "18446744073709551615";

    EXPECT_EQ(ctx.number_param("seq"), 42u);
    EXPECT_FALSE(ctx.number_param("neg").has_value());
    EXPECT_FALSE(ctx.number_param("big").has_value());
    EXPECT_EQ(ctx.number_param("max"), UINT64_MAX);
    EXPECT_FALSE(ctx.number_param("missing").has_value());
}

TEST(HttpRouterTest, ParameterDoesNotSpanSegments) {
    HttpRouter router;
    router.get("/source/:id", [](const HttpContext&) { return text("show"); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/source/1/initiate"));
    EXPECT_EQ(response.status_code, 404);
}

TEST(HttpRouterTest, MiddlewareCanShortCircuit) {
    HttpRouter router;
    int handled = 0;
    router.use([](const HttpContext& ctx, HttpResponse& response) {
        if (ctx.request.get_header("Authorization").empty()) {
            response = HttpResponse(HttpStatus::UNAUTHORIZED);
            return false;
        }
        return true;
    });
    router.get("/private", [&](const HttpContext&) {
        handled++;
        return text("ok");
    });

    auto denied = router.handle_request(make_request(HttpMethod::GET, "/private"));
    EXPECT_EQ(denied.status_code, 401);
    EXPECT_EQ(handled, 0);

    auto request = make_request(HttpMethod::GET, "/private");
    request.set_header("Authorization", "Basic abc");
    EXPECT_EQ(router.handle_request(request).status_code, 200);
    EXPECT_EQ(handled, 1);
}

TEST(HttpRouterTest, HandlerExceptionBecomes500) {
    HttpRouter router;
    router.get("/boom", [](const HttpContext&) -> HttpResponse { throw std::runtime_error("bad"); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/boom"));
    EXPECT_EQ(response.status_code, 500);
}

TEST(HttpRouterTest, ListsRegisteredRoutes) {
    HttpRouter router;
    router.get("/a", [](const HttpContext&) { return text(""); });
    router.patch("/b/:id", [](const HttpContext&) { return text(""); });

    EXPECT_EQ(router.route_count(), 2u);
    EXPECT_EQ(router.list_routes(), (std::vector<std::string>{"GET /a", "PATCH /b/:id"}));
}

TEST(HttpRouterTest, PathHelpers) {
    EXPECT_EQ(split_path("/source/7/"), (std::vector<std::string>{"source", "7"}));
    EXPECT_EQ(split_path("v1.0//x"), (std::vector<std::string>{"v1.0", "x"}));
    EXPECT_TRUE(split_path("/").empty());

    EXPECT_EQ(path_of("/source/1?x=y"), "/source/1");
    EXPECT_EQ(path_of("/source/1"), "/source/1");
}
