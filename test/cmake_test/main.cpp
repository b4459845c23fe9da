#include <boost/safestring.hpp>

int main() {
  auto s = boost::safestring::html_string::from_untrusted("<b>");
  if (s.str() != "&lt;b&gt;") {
    throw;
  }
}
