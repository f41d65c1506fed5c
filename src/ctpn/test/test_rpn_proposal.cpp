#include <algorithm>
#include <cmath>
#include <functional>
#include <vector>

#include "ctpn/RPN/rpn_anchor_generator.hpp"
#include "ctpn/RPN/rpn_proposal.hpp"
#include "ctpn/test/test_ctpn_main.hpp"

namespace ctpn {

using Rpn::Anchor;
using Rpn::ImageInfo;
using Rpn::NmsProposalDecoder;
using Rpn::Proposal;
using Rpn::TopProposalDecoder;

template <typename Dtype>
class ProposalDecoderTest : public ::testing::Test {
 protected:
  // 4 x 4 lattice of 16 x 16 anchors over a 64 x 64 image
  ProposalDecoderTest()
      : im_info_(64, 64, 1) {
    Rpn::AnchorGenerator<Dtype> generator(16, 1.43, 1);
    anchors_ = generator.Generate(4, 4, 16);
    deltas_.assign(anchors_.size() * 4, Dtype(0));
    RNG rng(1701);
    for (size_t i = 0; i < anchors_.size(); ++i) {
      scores_.push_back(Dtype(rng.rand() % 1000) / 1000);
    }
  }

  // scale every box up so neighbours overlap
  void Enlarge(Dtype factor) {
    for (size_t i = 0; i < anchors_.size(); ++i) {
      deltas_[i * 4 + 2] = std::log(factor);
      deltas_[i * 4 + 3] = std::log(factor);
    }
  }

  std::vector<Anchor<Dtype> > anchors_;
  std::vector<Dtype> scores_;
  std::vector<Dtype> deltas_;
  ImageInfo<Dtype> im_info_;
};

TYPED_TEST_CASE(ProposalDecoderTest, TestDtypes);

TYPED_TEST(ProposalDecoderTest, TestNmsDisjointKeepsAll) {
  NmsProposalDecoder<TypeParam> decoder(-1, 100, 0.7, 8);
  std::vector<Proposal<TypeParam> > proposals =
      decoder.Decode(this->anchors_, this->scores_, this->deltas_, this->im_info_);
  ASSERT_EQ(16u, proposals.size());
  for (size_t i = 1; i < proposals.size(); ++i) {
    EXPECT_GE(proposals[i - 1].score, proposals[i].score);
  }
  for (size_t i = 0; i < proposals.size(); ++i) {
    const Anchor<TypeParam>& anchor = this->anchors_[proposals[i].anchor_index];
    EXPECT_EQ(this->scores_[proposals[i].anchor_index], proposals[i].score);
    for (int j = 0; j < 4; ++j) {
      EXPECT_NEAR(std::min(anchor[j], TypeParam(63)), proposals[i][j], 1e-4);
    }
  }
}

TYPED_TEST(ProposalDecoderTest, TestNmsOverlapBelowThreshold) {
  this->Enlarge(2.5);
  const TypeParam nms_thresh = 0.3;
  NmsProposalDecoder<TypeParam> decoder(-1, 100, nms_thresh, 8);
  std::vector<Proposal<TypeParam> > proposals =
      decoder.Decode(this->anchors_, this->scores_, this->deltas_, this->im_info_);
  ASSERT_GT(proposals.size(), 0u);
  EXPECT_LT(proposals.size(), 16u);
  for (size_t i = 0; i < proposals.size(); ++i) {
    if (i > 0) EXPECT_GE(proposals[i - 1].score, proposals[i].score);
    for (size_t j = i + 1; j < proposals.size(); ++j) {
      EXPECT_LT(Rpn::get_iou(proposals[i], proposals[j]), nms_thresh);
    }
    // clipped to the image
    EXPECT_GE(proposals[i][0], 0);
    EXPECT_GE(proposals[i][1], 0);
    EXPECT_LE(proposals[i][2], 63);
    EXPECT_LE(proposals[i][3], 63);
  }
  // the best box always survives
  const int best = std::max_element(this->scores_.begin(), this->scores_.end()) - this->scores_.begin();
  EXPECT_EQ(best, proposals[0].anchor_index);
}

TYPED_TEST(ProposalDecoderTest, TestNmsSizeBounds) {
  NmsProposalDecoder<TypeParam> post_limited(-1, 5, 0.7, 8);
  EXPECT_EQ(5u, post_limited.Decode(this->anchors_, this->scores_, this->deltas_, this->im_info_).size());

  NmsProposalDecoder<TypeParam> pre_limited(3, 100, 0.7, 8);
  EXPECT_EQ(3u, pre_limited.Decode(this->anchors_, this->scores_, this->deltas_, this->im_info_).size());
}

TYPED_TEST(ProposalDecoderTest, TestNmsMinSize) {
  // 16 pixel boxes do not pass a 20 pixel minimum
  NmsProposalDecoder<TypeParam> decoder(-1, 100, 0.7, 20);
  EXPECT_TRUE(decoder.Decode(this->anchors_, this->scores_, this->deltas_, this->im_info_).empty());

  // the minimum is given at original image scale
  NmsProposalDecoder<TypeParam> scaled(-1, 100, 0.7, 20);
  ImageInfo<TypeParam> half(64, 64, 0.5);
  EXPECT_EQ(16u, scaled.Decode(this->anchors_, this->scores_, this->deltas_, half).size());
}

TYPED_TEST(ProposalDecoderTest, TestNmsEmptyInput) {
  NmsProposalDecoder<TypeParam> decoder(-1, 100, 0.7, 8);
  std::vector<Anchor<TypeParam> > anchors;
  std::vector<TypeParam> empty;
  EXPECT_TRUE(decoder.Decode(anchors, empty, empty, this->im_info_).empty());
}

TYPED_TEST(ProposalDecoderTest, TestNmsDeterministic) {
  this->Enlarge(2);
  NmsProposalDecoder<TypeParam> decoder(10, 6, 0.5, 8);
  std::vector<Proposal<TypeParam> > first =
      decoder.Decode(this->anchors_, this->scores_, this->deltas_, this->im_info_);
  std::vector<Proposal<TypeParam> > second =
      decoder.Decode(this->anchors_, this->scores_, this->deltas_, this->im_info_);
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].anchor_index, second[i].anchor_index);
    for (int j = 0; j < 4; ++j) {
      EXPECT_EQ(first[i][j], second[i][j]);
    }
  }
}

TYPED_TEST(ProposalDecoderTest, TestApplyNms) {
  std::vector<Proposal<TypeParam> > sorted;
  sorted.push_back(Proposal<TypeParam>(0, 0, 9, 9, 0.9, 0));
  // IoU 90 / 110 with the first box
  sorted.push_back(Proposal<TypeParam>(1, 0, 10, 9, 0.8, 1));
  sorted.push_back(Proposal<TypeParam>(20, 20, 29, 29, 0.7, 2));

  std::vector<Proposal<TypeParam> > kept = Rpn::apply_nms(sorted, TypeParam(0.7), 10);
  ASSERT_EQ(2u, kept.size());
  EXPECT_EQ(0, kept[0].anchor_index);
  EXPECT_EQ(2, kept[1].anchor_index);

  kept = Rpn::apply_nms(sorted, TypeParam(0.9), 10);
  EXPECT_EQ(3u, kept.size());

  kept = Rpn::apply_nms(sorted, TypeParam(0.7), 1);
  ASSERT_EQ(1u, kept.size());
  EXPECT_EQ(0, kept[0].anchor_index);
}

TYPED_TEST(ProposalDecoderTest, TestTopFixedSize) {
  TopProposalDecoder<TypeParam> decoder(5);
  std::vector<Proposal<TypeParam> > proposals =
      decoder.Decode(this->anchors_, this->scores_, this->deltas_, this->im_info_);
  ASSERT_EQ(5u, proposals.size());

  std::vector<TypeParam> sorted_scores(this->scores_);
  std::sort(sorted_scores.begin(), sorted_scores.end(), std::greater<TypeParam>());
  for (size_t i = 0; i < proposals.size(); ++i) {
    EXPECT_EQ(sorted_scores[i], proposals[i].score);
    EXPECT_GE(proposals[i].anchor_index, 0);
  }
}

TYPED_TEST(ProposalDecoderTest, TestTopPadding) {
  TopProposalDecoder<TypeParam> decoder(20);
  std::vector<Proposal<TypeParam> > proposals =
      decoder.Decode(this->anchors_, this->scores_, this->deltas_, this->im_info_);
  ASSERT_EQ(20u, proposals.size());
  for (size_t i = 0; i < 16; ++i) {
    EXPECT_GE(proposals[i].anchor_index, 0);
  }
  for (size_t i = 16; i < 20; ++i) {
    EXPECT_EQ(-1, proposals[i].anchor_index);
    EXPECT_EQ(0, proposals[i].score);
    for (int j = 0; j < 4; ++j) {
      EXPECT_EQ(0, proposals[i][j]);
    }
  }
}

TYPED_TEST(ProposalDecoderTest, TestTopTiesByIndex) {
  std::vector<TypeParam> flat(this->anchors_.size(), TypeParam(0.5));
  TopProposalDecoder<TypeParam> decoder(4);
  std::vector<Proposal<TypeParam> > proposals =
      decoder.Decode(this->anchors_, flat, this->deltas_, this->im_info_);
  ASSERT_EQ(4u, proposals.size());
  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(i, proposals[i].anchor_index);
  }
}

typedef ProposalDecoderTest<float> ProposalDecoderDeathTest;

TEST_F(ProposalDecoderDeathTest, TestShapeMismatch) {
  NmsProposalDecoder<float> nms(-1, 100, 0.7, 8);
  TopProposalDecoder<float> top(5);
  std::vector<float> short_scores(this->scores_.begin(), this->scores_.end() - 1);
  std::vector<float> short_deltas(this->deltas_.begin(), this->deltas_.end() - 4);
  EXPECT_DEATH(nms.Decode(this->anchors_, short_scores, this->deltas_, this->im_info_),
               "one score per anchor");
  EXPECT_DEATH(top.Decode(this->anchors_, this->scores_, short_deltas, this->im_info_),
               "four deltas per anchor");
}

}  // namespace ctpn
