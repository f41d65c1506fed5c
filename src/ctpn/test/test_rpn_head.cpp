#include <cmath>
#include <vector>

#include <boost/make_shared.hpp>
#include <opencv2/core/core.hpp>

#include "ctpn/RPN/rpn_head.hpp"
#include "ctpn/test/test_ctpn_main.hpp"

namespace ctpn {

using Rpn::FeatureExtractor;
using Rpn::FeatureMap;
using Rpn::GtBox;
using Rpn::ImageInfo;
using Rpn::RegionProposalHead;
using Rpn::RpnOutput;
using Rpn::RpnParam;

// Fixed backbone: zero logits and deltas on a stride 16 grid.
template <typename Dtype>
class ConstantExtractor : public FeatureExtractor<Dtype> {
 public:
  explicit ConstantExtractor(int num_anchors) : num_anchors_(num_anchors), calls_(0) {}
  virtual FeatureMap<Dtype> Extract(const cv::Mat& image) {
    calls_++;
    return FeatureMap<Dtype>(image.rows / 16, image.cols / 16, num_anchors_);
  }
  int calls() const { return calls_; }

 private:
  int num_anchors_;
  int calls_;
};

template <typename Dtype>
class RegionProposalHeadTest : public ::testing::Test {
 protected:
  // one 16 x 16 anchor per cell of a 2 x 2 grid, a 32 x 32 image and a
  // ground truth box covering all of it
  RegionProposalHeadTest()
      : feature_map_(2, 2, 1), im_info_(32, 32, 1) {
    param_.base_anchor_width = 16;
    param_.num_anchor_heights = 1;
    param_.feature_stride = 16;
    gt_boxes_.push_back(GtBox<Dtype>(0, 0, 31, 31));
  }

  RpnParam param_;
  FeatureMap<Dtype> feature_map_;
  ImageInfo<Dtype> im_info_;
  std::vector<GtBox<Dtype> > gt_boxes_;
};

TYPED_TEST_CASE(RegionProposalHeadTest, TestDtypes);

TYPED_TEST(RegionProposalHeadTest, TestTrainEndToEnd) {
  RegionProposalHead<TypeParam> head(this->param_, Rpn::TRAIN);
  RNG rng(3);
  RpnOutput<TypeParam> output = head.Forward(this->feature_map_, this->im_info_, this->gt_boxes_, &rng);

  ASSERT_EQ(4u, output.anchors.size());
  ASSERT_TRUE(output.has_losses);
  EXPECT_EQ(1, output.targets.count(1));
  EXPECT_EQ(3, output.targets.count(0));
  EXPECT_EQ(1, output.targets.labels[0]);

  // zero logits, every selected anchor costs log(2)
  EXPECT_TRUE(std::isfinite(output.losses.rpn_cross_entropy));
  EXPECT_GT(output.losses.rpn_cross_entropy, 0);
  EXPECT_NEAR(std::log(2.), output.losses.rpn_cross_entropy, 1e-5);
  EXPECT_GT(output.losses.rpn_loss_box, 0);
  EXPECT_NEAR(output.losses.rpn_cross_entropy + output.losses.rpn_loss_box,
              output.losses.total_loss, 1e-6);

  // the regression target leads back to the gt box
  Rpn::Box<TypeParam> decoded = Rpn::bbox_decode<TypeParam>(output.anchors[0],
                                                            output.targets.bbox_targets[0]);
  for (int j = 0; j < 4; ++j) {
    EXPECT_NEAR(this->gt_boxes_[0][j], decoded[j], 1e-4);
  }

  ASSERT_EQ(4u, output.cls_prob.size());
  for (size_t i = 0; i < output.cls_prob.size(); ++i) {
    EXPECT_NEAR(0.5, output.cls_prob[i], 1e-6);
    EXPECT_EQ(0, output.cls_pred[i]);
  }
  // disjoint anchors and zero deltas, nothing is suppressed
  EXPECT_EQ(4u, output.rois.size());
}

TYPED_TEST(RegionProposalHeadTest, TestTrainRegressionLoss) {
  RegionProposalHead<TypeParam> head(this->param_, Rpn::TRAIN);
  RNG rng(3);
  RpnOutput<TypeParam> output = head.Forward(this->feature_map_, this->im_info_, this->gt_boxes_, &rng);

  // predicting the target exactly removes the regression loss
  FeatureMap<TypeParam> perfect = this->feature_map_;
  for (int j = 0; j < 4; ++j) {
    perfect.bbox_pred[j] = output.targets.bbox_targets[0][j];
  }
  RNG rng_again(3);
  RpnOutput<TypeParam> exact = head.Forward(perfect, this->im_info_, this->gt_boxes_, &rng_again);
  EXPECT_NEAR(0, exact.losses.rpn_loss_box, 1e-6);
  EXPECT_NEAR(output.losses.rpn_cross_entropy, exact.losses.rpn_cross_entropy, 1e-6);
}

TYPED_TEST(RegionProposalHeadTest, TestForegroundLogits) {
  // foreground channel of anchor 2 wins
  this->feature_map_.cls_score[2 * 2 + 1] = 3;
  RegionProposalHead<TypeParam> head(this->param_, Rpn::TEST);
  RpnOutput<TypeParam> output = head.Forward(this->feature_map_, this->im_info_);
  EXPECT_FALSE(output.has_losses);
  EXPECT_EQ(1, output.cls_pred[2]);
  EXPECT_NEAR(1 / (1 + std::exp(-3.)), output.cls_prob[2], 1e-5);
  ASSERT_FALSE(output.rois.empty());
  EXPECT_EQ(2, output.rois[0].anchor_index);
}

TYPED_TEST(RegionProposalHeadTest, TestNoSelectedAnchors) {
  // no anchor fits an 8 x 8 image and every clipped box is too small
  RegionProposalHead<TypeParam> head(this->param_, Rpn::TRAIN);
  RNG rng(3);
  ImageInfo<TypeParam> tiny(8, 8, 1);
  std::vector<GtBox<TypeParam> > gt_boxes(1, GtBox<TypeParam>(0, 0, 7, 7));
  RpnOutput<TypeParam> output = head.Forward(this->feature_map_, tiny, gt_boxes, &rng);
  EXPECT_EQ(4, output.targets.count(-1));
  EXPECT_EQ(0, output.losses.rpn_cross_entropy);
  EXPECT_EQ(0, output.losses.rpn_loss_box);
  EXPECT_EQ(0, output.losses.total_loss);
  EXPECT_TRUE(output.rois.empty());
}

TYPED_TEST(RegionProposalHeadTest, TestTopMode) {
  this->param_.test_mode = "top";
  this->param_.top_k_n = 10;
  RegionProposalHead<TypeParam> head(this->param_, Rpn::TEST);
  EXPECT_STREQ("top", head.decoder().type());
  RpnOutput<TypeParam> output = head.Forward(this->feature_map_, this->im_info_);
  EXPECT_EQ(10u, output.rois.size());
}

TYPED_TEST(RegionProposalHeadTest, TestNmsMode) {
  this->param_.test_post_nms_top_n = 2;
  RegionProposalHead<TypeParam> head(this->param_, Rpn::TEST);
  EXPECT_STREQ("nms", head.decoder().type());
  RpnOutput<TypeParam> output = head.Forward(this->feature_map_, this->im_info_);
  EXPECT_EQ(2u, output.rois.size());
}

TYPED_TEST(RegionProposalHeadTest, TestImageThroughExtractor) {
  boost::shared_ptr<ConstantExtractor<TypeParam> > extractor =
      boost::make_shared<ConstantExtractor<TypeParam> >(1);
  RegionProposalHead<TypeParam> head(this->param_, Rpn::TRAIN, extractor);
  cv::Mat image(32, 32, CV_8UC3, cv::Scalar(0, 0, 0));
  RNG rng(3);
  RpnOutput<TypeParam> output = head.Forward(image, TypeParam(1), this->gt_boxes_, &rng);
  EXPECT_EQ(1, extractor->calls());
  EXPECT_EQ(4u, output.anchors.size());
  EXPECT_EQ(1, output.targets.count(1));
}

typedef RegionProposalHeadTest<float> RegionProposalHeadDeathTest;

TEST_F(RegionProposalHeadDeathTest, TestUnsupportedMode) {
  this->param_.test_mode = "random";
  EXPECT_DEATH(RegionProposalHead<float>(this->param_, Rpn::TEST), "Unsupported test mode");
}

TEST_F(RegionProposalHeadDeathTest, TestShapeMismatch) {
  RegionProposalHead<float> head(this->param_, Rpn::TEST);
  FeatureMap<float> broken = this->feature_map_;
  broken.bbox_pred.pop_back();
  EXPECT_DEATH(head.Forward(broken, this->im_info_), "");

  FeatureMap<float> wrong_anchors(2, 2, 3);
  EXPECT_DEATH(head.Forward(wrong_anchors, this->im_info_), "configured anchor heights");
}

TEST_F(RegionProposalHeadDeathTest, TestTrainNeedsRandomSource) {
  RegionProposalHead<float> head(this->param_, Rpn::TRAIN);
  EXPECT_DEATH(head.Forward(this->feature_map_, this->im_info_, this->gt_boxes_, NULL),
               "random source");
}

TEST_F(RegionProposalHeadDeathTest, TestImageNeedsExtractor) {
  RegionProposalHead<float> head(this->param_, Rpn::TEST);
  cv::Mat image(32, 32, CV_8UC3, cv::Scalar(0, 0, 0));
  RNG rng(3);
  EXPECT_DEATH(head.Forward(image, 1.f, this->gt_boxes_, &rng), "FeatureExtractor");
}

}  // namespace ctpn
