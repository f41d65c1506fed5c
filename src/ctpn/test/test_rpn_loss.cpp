#include <cmath>
#include <vector>

#include "ctpn/RPN/rpn_loss.hpp"
#include "ctpn/test/test_ctpn_main.hpp"

namespace ctpn {

using Rpn::Point4f;

template <typename Dtype>
class SmoothL1Test : public ::testing::Test {
 protected:
  SmoothL1Test() : ones_(1, 1, 1, 1), zeros_(0, 0, 0, 0) {}

  // loss of a single coordinate with diff x, unit weights
  Dtype Single(Dtype x, Dtype sigma) {
    return Rpn::smooth_l1(Point4f<Dtype>(x, 0, 0, 0), zeros_, ones_, ones_, sigma);
  }

  Point4f<Dtype> ones_;
  Point4f<Dtype> zeros_;
};

TYPED_TEST_CASE(SmoothL1Test, TestDtypes);

TYPED_TEST(SmoothL1Test, TestZeroDiff) {
  Point4f<TypeParam> pred(0.3, -1.2, 4, 0.01);
  EXPECT_EQ(0, Rpn::smooth_l1(pred, pred, this->ones_, this->ones_, TypeParam(3)));
}

TYPED_TEST(SmoothL1Test, TestBranches) {
  // quadratic 0.5 * x^2 and linear |x| - 0.5 with sigma 1
  EXPECT_NEAR(0.125, this->Single(0.5, 1), 1e-6);
  EXPECT_NEAR(0.125, this->Single(-0.5, 1), 1e-6);
  EXPECT_NEAR(1.5, this->Single(2, 1), 1e-6);
  EXPECT_NEAR(1.5, this->Single(-2, 1), 1e-6);
  // sigma 3 moves the knee to 1 / 9
  EXPECT_NEAR(0.5 * 9 * 0.01, this->Single(0.1, 3), 1e-6);
  EXPECT_NEAR(1 - 0.5 / 9, this->Single(1, 3), 1e-6);
}

TYPED_TEST(SmoothL1Test, TestContinuousAtKnee) {
  const TypeParam eps = 1e-4;
  EXPECT_NEAR(0.5, this->Single(1, 1), 1e-6);
  EXPECT_NEAR(this->Single(1 - eps, 1), this->Single(1 + eps, 1), 3 * eps);
  const TypeParam knee = TypeParam(1) / 9;
  EXPECT_NEAR(0.5 / 9, this->Single(knee, 3), 1e-6);
  EXPECT_NEAR(this->Single(knee - eps, 3), this->Single(knee + eps, 3), 3 * eps);
}

TYPED_TEST(SmoothL1Test, TestWeights) {
  Point4f<TypeParam> pred(2, 2, 2, 2);
  Point4f<TypeParam> inside(0, 1, 0, 1);
  Point4f<TypeParam> outside(1, 1, 2, 0);
  // only the second coordinate has both weights
  EXPECT_NEAR(1.5, Rpn::smooth_l1(pred, this->zeros_, inside, outside, TypeParam(1)), 1e-6);
  EXPECT_NEAR(6, Rpn::smooth_l1(pred, this->zeros_, this->ones_, this->ones_, TypeParam(1)), 1e-6);
}

TYPED_TEST(SmoothL1Test, TestBatchMean) {
  std::vector<Point4f<TypeParam> > preds, targets, inside, outside;
  EXPECT_EQ(0, Rpn::smooth_l1_loss(preds, targets, inside, outside, TypeParam(3)));

  preds.push_back(Point4f<TypeParam>(2, 0, 0, 0));
  preds.push_back(Point4f<TypeParam>(0, 0, 0, 0));
  targets.assign(2, this->zeros_);
  inside.assign(2, this->ones_);
  outside.assign(2, this->ones_);
  EXPECT_NEAR(0.75, Rpn::smooth_l1_loss(preds, targets, inside, outside, TypeParam(1)), 1e-6);
}

TYPED_TEST(SmoothL1Test, TestSoftmax) {
  EXPECT_NEAR(0.5, Rpn::softmax_fg_prob(TypeParam(0), TypeParam(0)), 1e-6);
  EXPECT_NEAR(1 / (1 + std::exp(-2.)), Rpn::softmax_fg_prob(TypeParam(-1), TypeParam(1)), 1e-6);
  // large logits do not overflow
  EXPECT_NEAR(1, Rpn::softmax_fg_prob(TypeParam(-1000), TypeParam(1000)), 1e-6);
  EXPECT_NEAR(0, Rpn::softmax_fg_prob(TypeParam(1000), TypeParam(-1000)), 1e-6);
}

TYPED_TEST(SmoothL1Test, TestCrossEntropy) {
  EXPECT_NEAR(std::log(2.), Rpn::softmax_cross_entropy(TypeParam(0), TypeParam(0), 1), 1e-6);
  EXPECT_NEAR(std::log(2.), Rpn::softmax_cross_entropy(TypeParam(0), TypeParam(0), 0), 1e-6);
  const TypeParam wrong = Rpn::softmax_cross_entropy(TypeParam(500), TypeParam(-500), 1);
  EXPECT_TRUE(std::isfinite(wrong));
  EXPECT_NEAR(1000, wrong, 1e-3);
  EXPECT_NEAR(0, Rpn::softmax_cross_entropy(TypeParam(500), TypeParam(-500), 0), 1e-6);
}

}  // namespace ctpn
