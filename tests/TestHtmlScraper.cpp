#include "data/GoogleFinanceSource.h"
#include "data/HtmlScraper.h"
#include "data/YahooChartSource.h"

#include <cmath>
#include <iostream>
#include <string>

using revscan::data::GoogleFinanceSource;
using revscan::data::HtmlScraper;
using revscan::data::YahooChartSource;

#define EXPECT(cond, msg)                                                        \
    do {                                                                         \
        if (!(cond)) {                                                           \
            std::cerr << "[TEST] " << msg << " (line " << __LINE__ << ")\n";     \
            return 1;                                                            \
        }                                                                        \
    } while (0)

namespace {
bool near(const std::optional<double>& value, double expected) {
    return value && std::fabs(*value - expected) < 1e-9;
}

const char* kQuotePage = R"html(<html><head><title>TCS Share Price - Tata Consultancy Services Stock Price Today</title></head>
<body>
  <div class="zzDege">Tata Consultancy Services Ltd</div>
  <div class="rPF6Lc"><div class="YMlKec fxKbKc">&#8377;3,812.45</div></div>
  <div class="gyFHrc"><span class="icon"></span><div class="mfs7Fc">P/E ratio</div><div class="P6K39c">29.87</div></div>
  <div class="gyFHrc"><div class="mfs7Fc">Dividend yield</div><div class="P6K39c">1.25%</div></div>
  <table>
    <tr><td>Book value</td><td>Ignored</td><td>278.10</td></tr>
    <tr><td>ROCE</td><td>58.2%</td></tr>
    <tr><td>Total debt</td><td>$8,021.5</td></tr>
  </table>
  <a class="py3Ok" href="/sector">IT Services</a>
</body></html>)html";
}

int main() {
    std::cout << "[TEST] Starting HtmlScraper Test..." << std::endl;

    // Number parsing
    {
        EXPECT(near(HtmlScraper::parseNumber("1,234.5"), 1234.5), "thousands separator");
        EXPECT(near(HtmlScraper::parseNumber("\xE2\x82\xB9" "3,812.45"), 3812.45), "rupee sign");
        EXPECT(near(HtmlScraper::parseNumber(" 12.5% "), 12.5), "percent sign");
        EXPECT(near(HtmlScraper::parseNumber("$-4.2"), -4.2), "dollar sign");
        EXPECT(!HtmlScraper::parseNumber("-"), "dash is not a number");
        EXPECT(!HtmlScraper::parseNumber(""), "empty");
        EXPECT(!HtmlScraper::parseNumber("12.3 Cr"), "trailing text rejected");
        EXPECT(!HtmlScraper::parseNumber("nan"), "non-finite rejected");
    }

    // Selection and text
    {
        EXPECT(HtmlScraper::textContent("<p> a  <b>b</b>\n c &amp; d</p>") == "a b c & d", "text content");

        const std::string nested = "<div class=\"x\"><div class=\"y\">inner</div></div><div class=\"y z\">two</div>";
        const auto ys = HtmlScraper::select(nested, "div.y");
        EXPECT(ys.size() == 2, "two div.y elements, got " << ys.size());
        EXPECT(HtmlScraper::textContent(ys[0]) == "inner", "first div.y");
        EXPECT(HtmlScraper::select(nested, "div.y.z").size() == 1, "class subset match");
        EXPECT(HtmlScraper::select(nested, "div.x div.y").size() == 1, "descendant selector");
        EXPECT(HtmlScraper::selectFirstText(nested, "div.x") == std::optional<std::string>("inner"),
               "outer element spans the nested one");
        EXPECT(!HtmlScraper::selectFirstText(nested, "span"), "missing tag");

        EXPECT(HtmlScraper::firstAttribute("<div data-last-price=\"101.5\"></div>", "data-last-price") ==
                   std::optional<std::string>("101.5"),
               "attribute lookup");
        EXPECT(HtmlScraper::firstAttribute("<div x-data-last-price=\"1\" DATA-LAST-PRICE = '2'>", "data-last-price") ==
                   std::optional<std::string>("2"),
               "prefixed name skipped, case and quotes tolerated");
        const std::string blob(300000, 'q');
        EXPECT(HtmlScraper::firstAttribute("<div data-state=\"" + blob + "\">", "data-state")->size() == blob.size(),
               "large attribute value");
        EXPECT(HtmlScraper::select("<div data-class=\"y\" class='y'>ok</div>", "div.y").size() == 1,
               "class attribute in single quotes");
        EXPECT(HtmlScraper::title("<title> Hello </title>") == std::optional<std::string>("Hello"), "title");
    }

    // Key/value rows from both layouts
    {
        const auto kv = HtmlScraper::keyValuePairs(kQuotePage);
        EXPECT(kv.count("p/e ratio") && kv.at("p/e ratio") == "29.87", "div row");
        EXPECT(kv.count("book value") && kv.at("book value") == "278.10", "table row uses last cell");
        EXPECT(kv.count("roce") && kv.at("roce") == "58.2%", "table row lower-cased key");
    }

    // Fundamentals from a quote page
    {
        const auto f = GoogleFinanceSource::parseFundamentals("TCS", kQuotePage);
        EXPECT(f.symbol == "TCS", "symbol");
        EXPECT(f.name && *f.name == "Tata Consultancy Services Ltd", "name");
        EXPECT(near(f.cmp, 3812.45), "cmp");
        EXPECT(near(f.pe, 29.87), "pe");
        EXPECT(near(f.bv, 278.10), "bv");
        EXPECT(near(f.roce, 58.2), "roce");
        EXPECT(near(f.debt, 8021.5), "debt");
        EXPECT(f.industry && *f.industry == "IT Services", "industry");
    }

    // Fallbacks: title name, price attribute, unknown fields stay empty
    {
        const std::string page =
            "<html><head><title>INFY Share Price - Infosys Ltd Stock Price</title></head>"
            "<body><span data-last-price=\"1,520.30\"></span>"
            "<table><tr><td>Sector</td><td>Technology</td></tr></table></body></html>";
        const auto f = GoogleFinanceSource::parseFundamentals("INFY", page);
        EXPECT(f.name && *f.name == "Infosys Ltd", "name from title, got '" << f.name.value_or("") << "'");
        EXPECT(near(f.cmp, 1520.30), "cmp from attribute");
        EXPECT(!f.pe && !f.bv && !f.roce && !f.debt, "missing ratios stay empty");
        EXPECT(f.industry && *f.industry == "Technology", "industry from sector row");
    }

    // Price history extraction
    {
        const std::string tuples =
            "data:[[1700000000000,1,2,3,101.5]],x,[[1700086400,1,2,3,102.25]]";
        const auto bars = GoogleFinanceSource::parsePriceHistory(tuples);
        EXPECT(bars.size() == 2, "two tuples, got " << bars.size());
        EXPECT(bars[0].date == "2023-11-14" && bars[0].close == 101.5, "ms timestamp scaled");
        EXPECT(bars[1].date == "2023-11-15" && bars[1].close == 102.25, "second timestamp");

        const std::string scripted =
            "<script>var d=[{\"date\":\"2024-01-02\",\"open\":1,\"close\": 55.5},"
            "{\"date\":\"2024-01-03\",\"close\":56}];</script>";
        const auto dated = GoogleFinanceSource::parsePriceHistory(scripted);
        EXPECT(dated.size() == 2, "dated pattern, got " << dated.size());
        EXPECT(dated[0].date == "2024-01-02" && dated[0].close == 55.5, "dated close");

        EXPECT(GoogleFinanceSource::parsePriceHistory("<html>nothing</html>").empty(), "no chart data");

        const auto fenced = GoogleFinanceSource::parsePriceHistory(
            "<script>[{\"d\":\"2024-01-02\"},{\"close\":3}]</script>");
        EXPECT(fenced.empty(), "close behind a closing brace belongs to another object");
    }

    // Large script blocks are scanned without blowing the stack
    {
        std::string body = "\"2024-01-02\",";
        while (body.size() < 200000) {
            body += "[1,2,3.5,\"x\"],";
        }
        EXPECT(GoogleFinanceSource::parsePriceHistory("<script>" + body + "</script>").empty(),
               "200 KB script without a close value");

        const auto tail = GoogleFinanceSource::parsePriceHistory("<script>" + body + "\"close\": 12.5</script>");
        EXPECT(tail.size() == 1 && tail[0].date == "2024-01-02" && tail[0].close == 12.5,
               "close far after its date, got " << tail.size());

        std::string many = "<script>var rows=[";
        for (int i = 0; i < 4000; ++i) {
            many += "{\"date\":\"2023-0" + std::to_string(1 + i % 9) + "-1" + std::to_string(i % 10) +
                    "\",\"volume\":[1,2,3,4,5,6,7,8,9],\"close\":" + std::to_string(100 + i) + "},";
        }
        many += "];</script>";
        const auto rows = GoogleFinanceSource::parsePriceHistory(many);
        EXPECT(rows.size() == 4000, "every dated object read, got " << rows.size());
        EXPECT(rows.back().close == 4099.0, "last close");
    }

    // Chart JSON
    {
        const std::string body = R"({"chart":{"result":[{"timestamp":[1700000000,1700086400,1700172800],
            "indicators":{"quote":[{"close":[101.0,null,103.5]}]}}],"error":null}})";
        const auto bars = YahooChartSource::parseChart(body);
        EXPECT(bars.size() == 2, "null close skipped");
        EXPECT(bars[1].date == "2023-11-16" && bars[1].close == 103.5, "chart values");

        bool threw = false;
        try {
            YahooChartSource::parseChart("not json");
        } catch (const std::exception&) {
            threw = true;
        }
        EXPECT(threw, "malformed chart body throws");
    }

    std::cout << "[TEST] HtmlScraper PASSED" << std::endl;
    return 0;
}
