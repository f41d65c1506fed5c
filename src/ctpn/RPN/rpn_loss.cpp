// ------------------------------------------------------------------
// CTPN region proposal core : rpn losses
// ------------------------------------------------------------------

#include "ctpn/RPN/rpn_loss.hpp"

namespace ctpn {

namespace Rpn {

using std::vector;

template <typename Dtype>
Dtype smooth_l1(const Point4f<Dtype>& pred, const Point4f<Dtype>& target,
                const Point4f<Dtype>& inside_weights, const Point4f<Dtype>& outside_weights,
                Dtype sigma) {
  CHECK_GT(sigma, 0) << "smooth l1 sigma must be positive";
  const Dtype sigma2 = sigma * sigma;
  Dtype loss = 0;
  for (int j = 0; j < 4; j++) {
    const Dtype diff = inside_weights[j] * (pred[j] - target[j]);
    const Dtype abs_val = std::fabs(diff);
    Dtype val;
    if (abs_val < Dtype(1) / sigma2) {
      val = Dtype(0.5) * diff * diff * sigma2;
    } else {
      val = abs_val - Dtype(0.5) / sigma2;
    }
    loss += outside_weights[j] * val;
  }
  return loss;
}
template float smooth_l1(const Point4f<float>& pred, const Point4f<float>& target,
    const Point4f<float>& inside_weights, const Point4f<float>& outside_weights, float sigma);
template double smooth_l1(const Point4f<double>& pred, const Point4f<double>& target,
    const Point4f<double>& inside_weights, const Point4f<double>& outside_weights, double sigma);

template <typename Dtype>
Dtype smooth_l1_loss(const vector<Point4f<Dtype> >& preds, const vector<Point4f<Dtype> >& targets,
                     const vector<Point4f<Dtype> >& inside_weights,
                     const vector<Point4f<Dtype> >& outside_weights, Dtype sigma) {
  CHECK_EQ(preds.size(), targets.size());
  CHECK_EQ(preds.size(), inside_weights.size());
  CHECK_EQ(preds.size(), outside_weights.size());
  if (preds.empty()) return 0;
  Dtype loss = 0;
  for (size_t i = 0; i < preds.size(); i++) {
    loss += smooth_l1(preds[i], targets[i], inside_weights[i], outside_weights[i], sigma);
  }
  return loss / preds.size();
}
template float smooth_l1_loss(const vector<Point4f<float> >& preds,
    const vector<Point4f<float> >& targets, const vector<Point4f<float> >& inside_weights,
    const vector<Point4f<float> >& outside_weights, float sigma);
template double smooth_l1_loss(const vector<Point4f<double> >& preds,
    const vector<Point4f<double> >& targets, const vector<Point4f<double> >& inside_weights,
    const vector<Point4f<double> >& outside_weights, double sigma);

template <typename Dtype>
Dtype softmax_fg_prob(Dtype bg_logit, Dtype fg_logit) {
  const Dtype max_logit = std::max(bg_logit, fg_logit);
  const Dtype e_bg = std::exp(bg_logit - max_logit);
  const Dtype e_fg = std::exp(fg_logit - max_logit);
  return e_fg / (e_bg + e_fg);
}
template float softmax_fg_prob(float bg_logit, float fg_logit);
template double softmax_fg_prob(double bg_logit, double fg_logit);

template <typename Dtype>
Dtype softmax_cross_entropy(Dtype bg_logit, Dtype fg_logit, int label) {
  CHECK(label == 0 || label == 1) << "label : " << label;
  // log-sum-exp shifted by the max logit
  const Dtype max_logit = std::max(bg_logit, fg_logit);
  const Dtype log_sum = max_logit +
      std::log(std::exp(bg_logit - max_logit) + std::exp(fg_logit - max_logit));
  return log_sum - (label == 1 ? fg_logit : bg_logit);
}
template float softmax_cross_entropy(float bg_logit, float fg_logit, int label);
template double softmax_cross_entropy(double bg_logit, double fg_logit, int label);

} // namespace Rpn

} // namespace ctpn
