#include "ctpn/RPN/util/rpn_helper.hpp"

namespace ctpn {

namespace Rpn {

using std::vector;

template <typename Dtype>
Point4f<Dtype> bbox_encode(const Box<Dtype>& anchor, const Box<Dtype>& gt) {
  const Dtype ex_width = anchor.width();
  const Dtype ex_height = anchor.height();
  const Dtype targets_dx = (gt.ctr_x() - anchor.ctr_x()) / ex_width;
  const Dtype targets_dy = (gt.ctr_y() - anchor.ctr_y()) / ex_height;
  const Dtype targets_dw = std::log(gt.width() / ex_width);
  const Dtype targets_dh = std::log(gt.height() / ex_height);
  return Point4f<Dtype>(targets_dx, targets_dy, targets_dw, targets_dh);
}
template Point4f<float> bbox_encode(const Box<float>& anchor, const Box<float>& gt);
template Point4f<double> bbox_encode(const Box<double>& anchor, const Box<double>& gt);

template <typename Dtype>
vector<Point4f<Dtype> > bbox_encode(const vector<Box<Dtype> >& anchors, const vector<Box<Dtype> >& gts) {
  CHECK_EQ(anchors.size(), gts.size());
  vector<Point4f<Dtype> > targets;
  targets.reserve(gts.size());
  for (size_t i = 0; i < gts.size(); i++) {
    targets.push_back(bbox_encode(anchors[i], gts[i]));
  }
  return targets;
}
template vector<Point4f<float> > bbox_encode(const vector<Box<float> >& anchors, const vector<Box<float> >& gts);
template vector<Point4f<double> > bbox_encode(const vector<Box<double> >& anchors, const vector<Box<double> >& gts);

template <typename Dtype>
Box<Dtype> bbox_decode(const Box<Dtype>& anchor, const Point4f<Dtype>& delta) {
  const Dtype src_w = anchor.width();
  const Dtype src_h = anchor.height();
  const Dtype pred_ctr_x = delta[0] * src_w + anchor.ctr_x();
  const Dtype pred_ctr_y = delta[1] * src_h + anchor.ctr_y();
  const Dtype pred_w = std::exp(delta[2]) * src_w;
  const Dtype pred_h = std::exp(delta[3]) * src_h;
  // widths count both border pixels, so the far corner sits one pixel in
  return Box<Dtype>(pred_ctr_x - Dtype(0.5) * pred_w, pred_ctr_y - Dtype(0.5) * pred_h,
                    pred_ctr_x + Dtype(0.5) * pred_w - 1, pred_ctr_y + Dtype(0.5) * pred_h - 1);
}
template Box<float> bbox_decode(const Box<float>& anchor, const Point4f<float>& delta);
template Box<double> bbox_decode(const Box<double>& anchor, const Point4f<double>& delta);

template <typename Dtype>
Box<Dtype> clip_box(const Box<Dtype>& box, Dtype image_width, Dtype image_height) {
  const Dtype bounds[4] = { image_width - 1, image_height - 1, image_width - 1, image_height - 1 };
  Dtype clipped[4];
  for (int q = 0; q < 4; q++) {
    clipped[q] = std::max(Dtype(0), std::min(box[q], bounds[q]));
  }
  return Box<Dtype>(clipped[0], clipped[1], clipped[2], clipped[3]);
}
template Box<float> clip_box(const Box<float>& box, float image_width, float image_height);
template Box<double> clip_box(const Box<double>& box, double image_width, double image_height);

} // namespace Rpn

} // namespace ctpn
