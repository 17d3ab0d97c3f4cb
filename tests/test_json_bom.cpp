#include <iostream>
#include <string>

#include "agrisim/util/json.h"

#define AGRISIM_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_json_bom() {
  // Windows editors can emit a UTF-8 BOM at the start of a config file.

  {
    std::string txt;
    txt += "\xEF\xBB\xBF";
    txt += "{\"kegs\": 1, \"seasons\": [true, null, \"summer\"]}";

    const auto v = agrisim::json::parse(txt);
    AGRISIM_ASSERT(v.is_object());
    AGRISIM_ASSERT(v.at("kegs").int_value() == 1);
    AGRISIM_ASSERT(v.at("seasons").is_array());
    AGRISIM_ASSERT(v.at("seasons").array().size() == 3);
    AGRISIM_ASSERT(v.at("seasons").array()[0].bool_value() == true);
    AGRISIM_ASSERT(v.at("seasons").array()[1].is_null());
    AGRISIM_ASSERT(v.at("seasons").array()[2].string_value() == "summer");
  }

  // BOM followed by whitespace should still work.
  {
    std::string txt;
    txt += "\xEF\xBB\xBF";
    txt += " \n\t{\"casks\": 2}\n";
    const auto v = agrisim::json::parse(txt);
    AGRISIM_ASSERT(v.is_object());
    AGRISIM_ASSERT(v.at("casks").int_value() == 2);
  }

  // Error positions do not count the BOM.
  {
    std::string txt;
    txt += "\xEF\xBB\xBF";
    txt += "[1,,2]";
    std::string msg;
    try {
      (void)agrisim::json::parse(txt);
    } catch (const std::runtime_error& e) {
      msg = e.what();
    }
    AGRISIM_ASSERT(msg.find("line 1, col 4") != std::string::npos);
  }

  // Stringify sorts keys, so reports diff cleanly.
  {
    agrisim::json::Object o;
    o["b"] = 2;
    o["a"] = "x";
    const std::string out = agrisim::json::stringify(agrisim::json::object(std::move(o)), 0);
    AGRISIM_ASSERT(out.find("\"a\"") < out.find("\"b\""));
    const auto back = agrisim::json::parse(out);
    AGRISIM_ASSERT(back.at("b").int_value() == 2);
  }

  return 0;
}
