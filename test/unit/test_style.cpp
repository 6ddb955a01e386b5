#include "sheetbinder/core/FormatRepository.hpp"
#include "sheetbinder/core/StyleBuilder.hpp"
#include "sheetbinder/core/StyleTransferContext.hpp"
#include <gtest/gtest.h>

using namespace sheetbinder::core;

class StyleTest : public ::testing::Test {
protected:
    StylePtr header_ = StyleBuilder()
                           .bold()
                           .fontSize(14)
                           .fontColor(Color(0x1F, 0x4E, 0x79))
                           .fill(Color::fromTheme(4, 0.4))
                           .border(BorderStyle::Thin)
                           .horizontalAlign(HorizontalAlign::Center)
                           .build();
};

// 相同属性构建的样式值相等，但不是同一个对象
TEST_F(StyleTest, BuilderProducesValueEqualBundles) {
    StylePtr again = StyleBuilder(*header_).build();
    EXPECT_NE(header_.get(), again.get());
    EXPECT_EQ(*header_, *again);
    EXPECT_EQ(header_->hash(), again->hash());

    StylePtr italic = StyleBuilder(*header_).italic().build();
    EXPECT_NE(*header_, *italic);
    EXPECT_TRUE(header_->getFont().bold);
    EXPECT_TRUE(italic->getFont().italic);
}

TEST_F(StyleTest, DefaultBundle) {
    const StyleBundle& def = StyleBundle::getDefault();
    EXPECT_EQ(def.getFont().name, "Calibri");
    EXPECT_DOUBLE_EQ(def.getFont().size, 11.0);
    EXPECT_EQ(def.getFill().pattern, PatternType::None);
    EXPECT_FALSE(def.isDateFormat());
}

TEST_F(StyleTest, DateFormatDetection) {
    EXPECT_TRUE((NumberFormat{14, ""}).isDate());
    EXPECT_TRUE((NumberFormat{22, ""}).isDate());
    EXPECT_FALSE((NumberFormat{4, ""}).isDate());
    EXPECT_TRUE((NumberFormat{164, "yyyy-mm-dd"}).isDate());
    EXPECT_TRUE((NumberFormat{165, "[$-409]d-mmm-yy;@"}).isDate());
    EXPECT_FALSE((NumberFormat{166, "#,##0.00"}).isDate());
    EXPECT_FALSE((NumberFormat{167, "\"days\" 0"}).isDate());
    EXPECT_FALSE((NumberFormat{168, "[Red]0.00"}).isDate());
}

TEST_F(StyleTest, RepositoryDeduplicatesByValue) {
    FormatRepository repo(StyleBuilder(StyleBundle::getDefault()).build());
    EXPECT_EQ(repo.getFormatCount(), 1u);
    EXPECT_EQ(repo.addFormat(nullptr), repo.getDefaultFormatId());

    int first = repo.addFormat(header_);
    int second = repo.addFormat(StyleBuilder(*header_).build());
    EXPECT_EQ(first, second);
    EXPECT_EQ(repo.getFormatCount(), 2u);

    int other = repo.addFormat(StyleBuilder().numberFormat("0.0%").build());
    EXPECT_NE(other, first);
    EXPECT_EQ(*repo.getFormat(first), *header_);

    // 非法编号回退到默认样式
    EXPECT_EQ(*repo.getFormat(999), StyleBundle::getDefault());
}

// 每个源样式只克隆一次，克隆与源值相等但不共享对象
TEST_F(StyleTest, TransferContextClonesOncePerSource) {
    StyleTransferContext context;
    StylePtr money = StyleBuilder().numberFormat("#,##0.00").build();

    StylePtr a = context.transfer(header_);
    StylePtr b = context.transfer(header_);
    StylePtr c = context.transfer(money);

    EXPECT_EQ(a.get(), b.get());
    EXPECT_NE(a.get(), header_.get());
    EXPECT_EQ(*a, *header_);
    EXPECT_EQ(*c, *money);

    auto stats = context.getTransferStats();
    EXPECT_EQ(stats.cloned_count, 2u);
    EXPECT_EQ(stats.reused_count, 1u);
    EXPECT_EQ(context.getCacheSize(), 2u);

    EXPECT_EQ(context.transfer(nullptr), nullptr);

    context.clearCache();
    EXPECT_EQ(context.getCacheSize(), 0u);
    EXPECT_NE(context.transfer(header_).get(), a.get());
}

TEST_F(StyleTest, ColorHexAndTheme) {
    Color rgb = Color::fromHex("FF1F4E79");
    EXPECT_EQ(rgb.getType(), Color::Type::RGB);
    EXPECT_EQ(rgb.toHex(), "FF1F4E79");

    Color theme = Color::fromTheme(4, 0.4);
    EXPECT_EQ(theme.getType(), Color::Type::Theme);
    EXPECT_EQ(theme.getValue(), 4u);
    EXPECT_DOUBLE_EQ(theme.getTint(), 0.4);
    EXPECT_NE(theme, Color::fromTheme(4));
}
