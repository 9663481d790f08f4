#pragma once

// Ventana fija de muestreo: cuenta frames y cada 0.5s calcula el promedio.
class FPSCounter {
public:
    static constexpr float UpdateInterval = 0.5f;

    // Devuelve true en el frame en que se recalcula el rate.
    bool onFrame(float dt);

    double rate() const { return m_rate; }
    int frameCount() const { return m_frames; }
    float elapsed() const { return m_elapsed; }

private:
    float m_elapsed = 0.f;
    int m_frames = 0;
    double m_rate = 0.0;
};
