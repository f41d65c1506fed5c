#include "ctpn/RPN/util/rpn_utils.hpp"

namespace ctpn {

namespace Rpn {

INSTANTIATE_CLASS(Point4f);
INSTANTIATE_CLASS(Box);
INSTANTIATE_CLASS(Anchor);
INSTANTIATE_CLASS(GtBox);
INSTANTIATE_CLASS(Proposal);

template <typename Dtype>
Dtype get_iou(const Box<Dtype> &A, const Box<Dtype> &B) {
  const Dtype xx1 = std::max(A[0], B[0]);
  const Dtype yy1 = std::max(A[1], B[1]);
  const Dtype xx2 = std::min(A[2], B[2]);
  const Dtype yy2 = std::min(A[3], B[3]);
  const Dtype inter = std::max(Dtype(0), xx2 - xx1 + 1) * std::max(Dtype(0), yy2 - yy1 + 1);
  if (inter <= 0) return Dtype(0);
  const Dtype uni = A.area() + B.area() - inter;
  return std::min(Dtype(1), inter / uni);
}
template float get_iou(const Box<float> &A, const Box<float> &B);
template double get_iou(const Box<double> &A, const Box<double> &B);

template <typename Dtype>
vector<Dtype> get_ious(const Box<Dtype> &A, const vector<Box<Dtype> > &B) {
  vector<Dtype> ious;
  ious.reserve(B.size());
  for (size_t i = 0; i < B.size(); i++) {
    ious.push_back(get_iou(A, B[i]));
  }
  return ious;
}
template vector<float> get_ious(const Box<float> &A, const vector<Box<float> > &B);
template vector<double> get_ious(const Box<double> &A, const vector<Box<double> > &B);

template <typename Dtype>
vector<vector<Dtype> > get_ious(const vector<Box<Dtype> > &A, const vector<Box<Dtype> > &B) {
  vector<vector<Dtype> > ious;
  ious.reserve(A.size());
  for (size_t i = 0; i < A.size(); i++) {
    ious.push_back(get_ious(A[i], B));
  }
  return ious;
}
template vector<vector<float> > get_ious(const vector<Box<float> > &A, const vector<Box<float> > &B);
template vector<vector<double> > get_ious(const vector<Box<double> > &A, const vector<Box<double> > &B);

} // namespace Rpn

} // namespace ctpn
