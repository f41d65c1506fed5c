// ------------------------------------------------------------------
// CTPN region proposal core : anchor lattice
// ------------------------------------------------------------------

#include "ctpn/RPN/rpn_anchor_generator.hpp"

namespace ctpn {

namespace Rpn {

using std::vector;

template <typename Dtype>
AnchorGenerator<Dtype>::AnchorGenerator(Dtype base_width, Dtype height_ratio_step, int num_heights) {
  Init(base_width, height_ratio_step, num_heights);
}

template <typename Dtype>
AnchorGenerator<Dtype>::AnchorGenerator(const RpnParam& param) {
  Init(param.base_anchor_width, param.height_ratio_step, param.num_anchor_heights);
}

template <typename Dtype>
void AnchorGenerator<Dtype>::Init(Dtype base_width, Dtype height_ratio_step, int num_heights) {
  CHECK_GT(base_width, 0) << "illegal anchor width : " << base_width;
  CHECK_GT(height_ratio_step, 0) << "illegal anchor height ratio step : " << height_ratio_step;
  CHECK_GT(num_heights, 0) << "illegal number of anchor heights : " << num_heights;

  base_anchors_.clear();
  Dtype height = base_width;
  for (int k = 0; k < num_heights; k++) {
    const Dtype half_w = Dtype(0.5) * (base_width - 1);
    const Dtype half_h = Dtype(0.5) * (height - 1);
    base_anchors_.push_back(Box<Dtype>(-half_w, -half_h, half_w, half_h));
    height *= height_ratio_step;
  }
  DLOG(INFO) << "AnchorGenerator : " << num_heights << " base anchors\n"
             << anchor_to_string(base_anchors_);
}

template <typename Dtype>
vector<Anchor<Dtype> > AnchorGenerator<Dtype>::Generate(int grid_height, int grid_width, int stride) const {
  CHECK_GT(grid_height, 0) << "illegal grid height : " << grid_height;
  CHECK_GT(grid_width, 0) << "illegal grid width : " << grid_width;
  CHECK_GT(stride, 0) << "illegal feature stride : " << stride;

  const int n_anchors = num_anchors();
  vector<Anchor<Dtype> > anchors;
  anchors.reserve(grid_height * grid_width * n_anchors);

  for (int h = 0; h < grid_height; h++) {
    for (int w = 0; w < grid_width; w++) {
      const Dtype shift_x = (w + Dtype(0.5)) * stride;
      const Dtype shift_y = (h + Dtype(0.5)) * stride;
      for (int k = 0; k < n_anchors; k++) {
        const Box<Dtype>& base = base_anchors_[k];
        const int index = (h * grid_width + w) * n_anchors + k;
        anchors.push_back(Anchor<Dtype>(base[0] + shift_x, base[1] + shift_y,
                                        base[2] + shift_x, base[3] + shift_y, index));
      }
    }
  }
  return anchors;
}

INSTANTIATE_CLASS(AnchorGenerator);

template <typename Dtype>
vector<Anchor<Dtype> > generate_anchors(int grid_height, int grid_width, int stride,
    Dtype base_width, Dtype height_ratio_step, int num_heights) {
  AnchorGenerator<Dtype> generator(base_width, height_ratio_step, num_heights);
  return generator.Generate(grid_height, grid_width, stride);
}
template vector<Anchor<float> > generate_anchors(int grid_height, int grid_width, int stride,
    float base_width, float height_ratio_step, int num_heights);
template vector<Anchor<double> > generate_anchors(int grid_height, int grid_width, int stride,
    double base_width, double height_ratio_step, int num_heights);

} // namespace Rpn

} // namespace ctpn
