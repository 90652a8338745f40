// Checks where the reload script lands in HTML bodies.
#include <cassert>
#include <iostream>
#include <string>

#include "html_inject.hpp"

using live_proxy::find_body_close;
using live_proxy::inject_reload_script;
using live_proxy::reload_script;

namespace {

constexpr unsigned short kPort = 8031;

void test_script_is_parameterized_with_port() {
    const std::string script = reload_script(kPort);
    assert(script.rfind("<script>", 0) == 0);
    assert(script.size() >= 9 && script.compare(script.size() - 9, 9, "</script>") == 0);
    assert(script.find("8031") != std::string::npos);
    assert(script.find("INSERT_PORT") == std::string::npos);
    assert(script.find("location.reload()") != std::string::npos);
}

void test_inserts_before_body_close() {
    const std::string html = "<html><body><p>hi</p></body></html>";
    const std::string out = inject_reload_script(html, kPort);
    const std::string script = reload_script(kPort);

    assert(out == "<html><body><p>hi</p>" + script + "</body></html>");
    assert(out.size() == html.size() + script.size());
}

void test_first_unguarded_body_close_wins() {
    const std::string html = "<p>a</p></body><p>b</p></body>";
    assert(find_body_close(html) == std::size_t(8));

    const std::string out = inject_reload_script(html, kPort);
    assert(out == "<p>a</p>" + reload_script(kPort) + "</body><p>b</p></body>");
}

void test_body_close_inside_comment_is_ignored() {
    const std::string html = "<html><!--</body>--><p>x</p></body></html>";
    const std::size_t real = html.rfind("</body>");
    assert(find_body_close(html) == real);

    const std::string out = inject_reload_script(html, kPort);
    assert(out == html.substr(0, real) + reload_script(kPort) + html.substr(real));
    // The commented one is untouched.
    assert(out.rfind("<html><!--</body>-->", 0) == 0);
}

void test_unterminated_comment_hides_everything_after_it() {
    const std::string html = "<p>x</p><!-- </body></html>";
    assert(!find_body_close(html));
    assert(inject_reload_script(html, kPort) == html + reload_script(kPort));
}

void test_appends_when_no_body_close() {
    const std::string html = "<h1>fragment</h1>";
    const std::string out = inject_reload_script(html, kPort);
    const std::string script = reload_script(kPort);

    assert(out == html + script);
    assert(out.size() == html.size() + script.size());

    assert(inject_reload_script("", kPort) == script);
}

} // namespace

int main() {
    test_script_is_parameterized_with_port();
    test_inserts_before_body_close();
    test_first_unguarded_body_close_wins();
    test_body_close_inside_comment_is_ignored();
    test_unterminated_comment_hides_everything_after_it();
    test_appends_when_no_body_close();

    std::cout << "html_inject tests passed" << std::endl;
    return 0;
}
