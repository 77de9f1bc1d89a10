#include "minitest.hpp"
#include "util/Markup.hpp"

using namespace mapwatch::util;

TEST(markup_nested_text_accumulates) {
  auto els = parse_markup(R"(<div id="a"><span>1</span> and <b>2</b></div>)");
  ASSERT_TRUE(els.has_value());
  ASSERT_EQ(els->size(), 3u);
  ASSERT_EQ((*els)[0].tag, "div");
  ASSERT_EQ((*els)[0].text, "1 and 2");
  ASSERT_EQ((*els)[1].text, "1");
  ASSERT_EQ(*(*els)[0].attr("id"), "a");
}

TEST(markup_attributes_quoting_and_case) {
  auto els = parse_markup(R"(<DIV Class='x y' data-n=5 title="a &amp; b" hidden></DIV>)");
  ASSERT_TRUE(els.has_value());
  const auto& d = (*els)[0];
  ASSERT_EQ(d.tag, "div");
  ASSERT_TRUE(d.has_class("x"));
  ASSERT_TRUE(d.has_class("y"));
  ASSERT_TRUE(!d.has_class("x y"));
  ASSERT_EQ(*d.attr("data-n"), "5");
  ASSERT_EQ(*d.attr("title"), "a & b");
  ASSERT_TRUE(d.attr("hidden") != nullptr);
}

TEST(markup_void_and_self_closing_do_not_swallow_text) {
  auto els = parse_markup(R"(<p>a<br>b<img src="x"/>c</p>)");
  ASSERT_TRUE(els.has_value());
  ASSERT_EQ((*els)[0].text, "abc");
  ASSERT_EQ((*els)[1].text, "");
}

TEST(markup_skips_comments_scripts_and_declarations) {
  auto els = parse_markup(R"(<!DOCTYPE html><!-- <span class="sensr">9</span> --><script>var s = "<span class='sensr'>";</script><i>ok</i>)");
  ASSERT_TRUE(els.has_value());
  ASSERT_EQ(select_by_class(*els, "sensr").size(), 0u);
  ASSERT_EQ(els->back().tag, "i");
  ASSERT_EQ(els->back().text, "ok");
}

TEST(markup_unclosed_elements_tolerated) {
  auto els = parse_markup("<ul><li>one<li>two</ul>");
  ASSERT_TRUE(els.has_value());
  ASSERT_EQ(els->size(), 3u);
}

TEST(markup_truncated_tag_fails) {
  ASSERT_TRUE(!parse_markup(R"(<div class="a)").has_value());
  ASSERT_TRUE(!parse_markup("<p>x</p><!-- open").has_value());
}

TEST(markup_gt_inside_quoted_attribute) {
  auto els = parse_markup(R"(<a title="x > y" class="k">t</a>)");
  ASSERT_TRUE(els.has_value());
  ASSERT_EQ(els->size(), 1u);
  ASSERT_TRUE((*els)[0].has_class("k"));
  ASSERT_EQ((*els)[0].text, "t");
}

TEST(markup_decode_entities) {
  ASSERT_EQ(decode_entities("&lt;b&gt; &#65;&#x42; &unknown; a&b"), "<b> AB &unknown; a&b");
}

TEST(markup_style_property) {
  ASSERT_EQ(style_property("color: red; Background-Color : #FFF !important", "background-color").value_or(""), "#FFF");
  ASSERT_EQ(style_property("color:blue", "color").value_or(""), "blue");
  ASSERT_TRUE(!style_property("color:blue", "border").has_value());
}
